#include "statik/static-file-config.hpp"

#include <stdexcept>

namespace statik {

void StaticFileConfig::validate() const {
  if (rootDirectory.empty()) {
    throw std::invalid_argument("StaticFileConfig.rootDirectory cannot be empty");
  }
  if (defaultIndex.empty()) {
    throw std::invalid_argument("StaticFileConfig.defaultIndex cannot be empty");
  }
  if (defaultIndex.contains('/') || defaultIndex.contains('\\')) {
    throw std::invalid_argument("StaticFileConfig.defaultIndex must not contain path separators");
  }
  if (cacheMaxAge.count() < 0) {
    throw std::invalid_argument("StaticFileConfig.cacheMaxAge cannot be negative");
  }
  if (fileChunkBytes == 0) {
    throw std::invalid_argument("StaticFileConfig.fileChunkBytes must be strictly positive");
  }
  if (gzipLevel < -1 || gzipLevel > 9) {
    throw std::invalid_argument("StaticFileConfig.gzipLevel must be in [-1, 9]");
  }
}

}  // namespace statik
