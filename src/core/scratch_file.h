#pragma once

/// @file scratch_file.h
/// @brief Temporary file removed when its owner goes out of scope.

#include <string>

namespace autopitch {

/// @brief Owns a unique path in the system temp directory.
/// @details The file is not created; a collaborator writes to path(). Whatever
/// exists at path() is removed by the destructor, on every exit path.
class ScratchFile {
 public:
  /// @brief Reserves a unique path.
  /// @param suffix File name suffix (e.g. ".wav")
  explicit ScratchFile(const std::string& suffix = ".wav");
  ~ScratchFile();

  ScratchFile(const ScratchFile&) = delete;
  ScratchFile& operator=(const ScratchFile&) = delete;
  ScratchFile(ScratchFile&& other) noexcept;
  ScratchFile& operator=(ScratchFile&& other) noexcept;

  /// @brief Returns the scratch path.
  const std::string& path() const { return path_; }

  /// @brief Returns true if something has been written to the path.
  bool exists() const;

 private:
  void remove() noexcept;

  std::string path_;
};

}  // namespace autopitch
