#pragma once
#include <optional>
#include <string>

// ISO-8601 <-> UTC epoch seconds.
//
// Accepts "YYYY-MM-DDTHH:MM:SS[.fff][Z|+hh:mm|-hh:mm|+hhmm]" (a space may
// replace the 'T'; no zone means UTC). Returns nullopt on anything else.
std::optional<double> parse_iso8601(const std::string &s);

// "YYYY-MM-DDTHH:MM:SSZ", with ".mmm" only when the time has milliseconds.
std::string format_iso8601(double epoch_s);
