#include "io/FileStore.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

static void discard(const std::string &part) {
  std::error_code ec;
  fs::remove(part, ec);
  if (ec)
    std::cerr << "[warn] could not remove " << part << ": " << ec.message()
              << "\n";
}

void store_file(const std::string &path, const std::string &data) {
  const std::string part = path + ".part";
  {
    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!out)
      throw std::runtime_error("cannot create " + part);
    out << data;
    out.close();
    if (!out) {
      discard(part);
      throw std::runtime_error("failed to write " + part);
    }
  }

  std::error_code ec;
  fs::rename(part, path, ec);
  if (ec) {
    discard(part);
    throw std::runtime_error("failed to save " + path + ": " + ec.message());
  }
}
