#include <fstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <resqx/options.hpp>

namespace resqx {

using nlohmann::json;

std::optional<PackageOptions> parseOptions(const json &config, Error *outError) {
  if (!config.is_object()) {
    fail(outError, Error(ErrorCode::Validation, "options must be a JSON object"));
    return std::nullopt;
  }

  PackageOptions options;
  for (const auto &[key, value] : config.items()) {
    Error error(ErrorCode::Validation, "");
    error.withField(key);

    if (key == "defaultCompression") {
      auto compression = value.is_string() ? parseCompression(value.get<std::string>())
                                           : std::nullopt;
      if (!compression) {
        error.message = "expected \"none\" or \"zlib\"";
        fail(outError, error);
        return std::nullopt;
      }
      options.defaultCompression = *compression;
    } else if (key == "compressionLevel") {
      if (!value.is_number_integer() || value.get<int>() < 1 || value.get<int>() > 9) {
        error.message = "expected an integer between 1 and 9";
        fail(outError, error);
        return std::nullopt;
      }
      options.compressionLevel = value.get<int>();
    } else if (key == "chunkBytes" || key == "streamingThreshold" || key == "cacheLimitBytes") {
      if (!value.is_number_unsigned()) {
        error.message = "expected a non-negative integer";
        fail(outError, error);
        return std::nullopt;
      }
      size_t bytes = value.get<size_t>();
      if (key == "chunkBytes") {
        if (bytes == 0) {
          error.message = "chunk size must be positive";
          fail(outError, error);
          return std::nullopt;
        }
        options.chunkBytes = bytes;
      } else if (key == "streamingThreshold") {
        options.streamingThreshold = bytes;
      } else {
        options.cacheLimitBytes = bytes;
      }
    } else if (key == "strictLoad") {
      if (!value.is_boolean()) {
        error.message = "expected a boolean";
        fail(outError, error);
        return std::nullopt;
      }
      options.strictLoad = value.get<bool>();
    } else {
      error.message = fmt::format("unknown option '{}'", key);
      fail(outError, error);
      return std::nullopt;
    }
  }
  return options;
}

std::optional<PackageOptions> loadOptions(const std::filesystem::path &path, Error *outError) {
  std::ifstream in(path);
  if (!in) {
    fail(outError, Error(ErrorCode::Io, fmt::format("Failed to open options file: {}",
                                                    path.string())));
    return std::nullopt;
  }

  json config = json::parse(in, nullptr, false);
  if (config.is_discarded()) {
    fail(outError, Error(ErrorCode::Validation,
                         fmt::format("Options file is not valid JSON: {}", path.string())));
    return std::nullopt;
  }
  return parseOptions(config, outError);
}

json toJson(const PackageOptions &options) {
  return json{{"defaultCompression", std::string(toString(options.defaultCompression))},
              {"compressionLevel", options.compressionLevel},
              {"chunkBytes", options.chunkBytes},
              {"streamingThreshold", options.streamingThreshold},
              {"cacheLimitBytes", options.cacheLimitBytes},
              {"strictLoad", options.strictLoad}};
}

} // namespace resqx
