#include "core/scratch_file.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <random>
#include <sstream>
#include <system_error>

#include "util/exception.h"

namespace autopitch {

namespace fs = std::filesystem;

namespace {

std::string unique_name(const std::string& suffix) {
  static std::atomic<unsigned> counter{0};
  std::random_device rd;
  auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();

  std::ostringstream ss;
  ss << "autopitch-" << std::hex << rd() << "-" << ticks << "-" << counter++ << suffix;
  return ss.str();
}

}  // namespace

ScratchFile::ScratchFile(const std::string& suffix) {
  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  AUTOPITCH_CHECK_MSG(!ec, ErrorCode::InvalidParameter,
                      "No temporary directory available: " + ec.message());

  fs::path candidate = dir / unique_name(suffix);
  while (fs::exists(candidate, ec)) {
    candidate = dir / unique_name(suffix);
  }
  path_ = candidate.string();
}

ScratchFile::~ScratchFile() { remove(); }

ScratchFile::ScratchFile(ScratchFile&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

ScratchFile& ScratchFile::operator=(ScratchFile&& other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

bool ScratchFile::exists() const {
  std::error_code ec;
  return !path_.empty() && fs::exists(path_, ec);
}

void ScratchFile::remove() noexcept {
  if (path_.empty()) return;
  std::error_code ec;
  fs::remove(path_, ec);
}

}  // namespace autopitch
