#include "trellis/file-tree-config.hpp"

#include <stdexcept>

namespace trellis {

void FileTreeConfig::validate() const {
  if (!fileSystem) {
    throw std::invalid_argument("FileTreeConfig.fileSystem cannot be null");
  }
  if (contentType && contentType->empty()) {
    throw std::invalid_argument("FileTreeConfig.contentType cannot be empty when set");
  }
}

}  // namespace trellis
