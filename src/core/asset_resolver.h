#pragma once

/// @file asset_resolver.h
/// @brief Composable lookup of concrete audio and metadata paths.
/// @details The resolution pipeline only ever receives concrete paths. Callers
/// build an ordered list of resolvers, each a pure function from a request to
/// an optional path, and take the first hit.

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace autopitch {

/// @brief Maps a request (name or path) to an existing file, or nothing.
using PathResolver = std::function<std::optional<std::string>(const std::string& request)>;

/// @brief Audio file extensions tried when a request has none.
extern const std::vector<std::string> kAudioExtensions;

/// @brief File name of the model metadata descriptor.
constexpr const char* kMetadataFileName = "model.meta.json";

/// @brief Returns the first path produced by the resolvers, in order.
/// @param resolvers Ordered candidates (empty entries are skipped)
/// @param request Name or path to resolve
/// @return First hit, or nothing if every resolver declines
std::optional<std::string> resolve_first(const std::vector<PathResolver>& resolvers,
                                         const std::string& request);

/// @brief Resolver accepting requests that already name an existing regular file.
PathResolver existing_path_resolver();

/// @brief Resolver looking inside a directory.
/// @details Tries dir/request, then dir/request + ext for each extension when
/// the request has no extension of its own.
/// @param dir Directory to search
/// @param extensions Extensions (with leading dot) tried in order
PathResolver directory_resolver(const std::string& dir,
                                const std::vector<std::string>& extensions = kAudioExtensions);

/// @brief Path of the metadata descriptor stored beside a model checkpoint.
/// @param model_path Path to the model file (e.g. models/alice/model.pth)
/// @return Sibling "model.meta.json" path
std::string model_metadata_path(const std::string& model_path);

}  // namespace autopitch
