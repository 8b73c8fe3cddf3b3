#include "core/asset_resolver.h"

#include <filesystem>
#include <system_error>

namespace autopitch {

namespace fs = std::filesystem;

const std::vector<std::string> kAudioExtensions = {".wav", ".mp3", ".flac",
                                                   ".m4a", ".ogg", ".aac"};

namespace {

bool is_file(const fs::path& p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec);
}

}  // namespace

std::optional<std::string> resolve_first(const std::vector<PathResolver>& resolvers,
                                         const std::string& request) {
  for (const auto& resolver : resolvers) {
    if (!resolver) continue;
    if (auto hit = resolver(request)) {
      return hit;
    }
  }
  return std::nullopt;
}

PathResolver existing_path_resolver() {
  return [](const std::string& request) -> std::optional<std::string> {
    if (!request.empty() && is_file(request)) {
      return request;
    }
    return std::nullopt;
  };
}

PathResolver directory_resolver(const std::string& dir,
                                const std::vector<std::string>& extensions) {
  return [dir, extensions](const std::string& request) -> std::optional<std::string> {
    if (request.empty()) return std::nullopt;

    fs::path candidate = fs::path(dir) / request;
    if (is_file(candidate)) {
      return candidate.string();
    }
    if (fs::path(request).has_extension()) {
      return std::nullopt;
    }
    for (const auto& ext : extensions) {
      fs::path with_ext = fs::path(dir) / (request + ext);
      if (is_file(with_ext)) {
        return with_ext.string();
      }
    }
    return std::nullopt;
  };
}

std::string model_metadata_path(const std::string& model_path) {
  return (fs::path(model_path).parent_path() / kMetadataFileName).string();
}

}  // namespace autopitch
