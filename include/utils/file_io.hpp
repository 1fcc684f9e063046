#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace FileIO {
  // Reads the whole file. Returns false and sets error on failure.
  bool ReadFileBytes(const std::string& path, std::vector<uint8_t>& out, std::string& error);
  // Writes and fsyncs "<path>.tmp", renames it over path, then fsyncs the parent
  // directory, so readers see either the old file or the complete new one. Returns false and sets error on failure;
  // the temporary file is removed in that case.
  bool WriteFileAtomic(const std::string& path, const std::vector<uint8_t>& bytes, std::string& error);
}
