#include "trellis/http-body.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>

#include "trellis/file-system.hpp"
#include "trellis/task.hpp"
#include "trellis/vector.hpp"

namespace trellis {

namespace {

std::string ConcatChunks(std::span<const std::string> chunks) {
  std::size_t totalSize = 0;
  for (const auto& chunk : chunks) {
    totalSize += chunk.size();
  }
  std::string out;
  out.reserve(totalSize);
  for (const auto& chunk : chunks) {
    out.append(chunk);
  }
  return out;
}

}  // namespace

HttpBody::HttpBody(std::string content) {
  vector<std::string> chunks;
  chunks.push_back(std::move(content));
  _data = std::move(chunks);
}

HttpBody HttpBody::Chunks(vector<std::string> chunks) {
  HttpBody body;
  body._data = std::move(chunks);
  return body;
}

HttpBody HttpBody::FromFile(FileSlice slice) {
  HttpBody body;
  body._data = std::move(slice);
  return body;
}

HttpBody HttpBody::Stream(StreamReader reader, std::optional<std::size_t> size) {
  HttpBody body;
  body._data = std::make_shared<StreamState>(std::move(reader), size);
  return body;
}

std::optional<std::size_t> HttpBody::knownSize() const noexcept {
  switch (kind()) {
    case Kind::Empty:
      return std::size_t{0};
    case Kind::Chunks: {
      std::size_t totalSize = 0;
      for (const auto& chunk : std::get<vector<std::string>>(_data)) {
        totalSize += chunk.size();
      }
      return totalSize;
    }
    case Kind::File:
      return std::get<FileSlice>(_data).length;
    case Kind::Stream:
      return std::get<std::shared_ptr<StreamState>>(_data)->size;
    default:
      return std::nullopt;
  }
}

std::span<const std::string> HttpBody::chunks() const noexcept {
  const auto* pChunks = std::get_if<vector<std::string>>(&_data);
  if (pChunks == nullptr) {
    return {};
  }
  return {pChunks->data(), pChunks->size()};
}

Task<std::optional<std::string>> HttpBody::read() {
  switch (kind()) {
    case Kind::Stream: {
      auto state = std::get<std::shared_ptr<StreamState>>(_data);
      co_return co_await state->reader();
    }
    case Kind::File: {
      const auto& slice = std::get<FileSlice>(_data);
      if (_consumed || _filePos >= slice.length) {
        co_return std::nullopt;
      }
      const std::size_t chunkSize = std::min(kFileChunkSize, slice.length - _filePos);
      std::string chunk = slice.file->readRange(slice.offset + _filePos, chunkSize);
      if (chunk.empty()) {
        // truncated since it was opened
        _consumed = true;
        co_return std::nullopt;
      }
      _filePos += chunk.size();
      co_return chunk;
    }
    case Kind::Chunks:
      if (_consumed) {
        co_return std::nullopt;
      }
      _consumed = true;
      co_return ConcatChunks(chunks());
    default:
      co_return std::nullopt;
  }
}

Task<std::string> HttpBody::readAll() {
  std::string content;
  while (auto chunk = co_await read()) {
    content.append(*chunk);
  }
  co_return content;
}

}  // namespace trellis
