#include "statik/server-config.hpp"

#include <stdexcept>

namespace statik {

void ServerConfig::validate() const {
  if (maxHeaderBytes == 0) {
    throw std::invalid_argument("ServerConfig.maxHeaderBytes must be strictly positive");
  }
  if (readChunkBytes == 0) {
    throw std::invalid_argument("ServerConfig.readChunkBytes must be strictly positive");
  }
  if (outboundHighWaterMark == 0) {
    throw std::invalid_argument("ServerConfig.outboundHighWaterMark must be strictly positive");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("ServerConfig.pollInterval must be strictly positive");
  }
  staticFiles.validate();
}

}  // namespace statik
