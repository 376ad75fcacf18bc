#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include "trellis/file-system.hpp"
#include "trellis/task.hpp"
#include "trellis/vector.hpp"

namespace trellis {

// Body of a request or a response.
// It is one of:
//  - empty
//  - a list of in-memory chunks
//  - a slice of an opened file
//  - a single pass stream of chunks, pulled asynchronously until it yields std::nullopt
// Bodies are cheap to copy: chunks are copied, file and stream states are shared.
class HttpBody {
 public:
  // Returns the next chunk, or std::nullopt when the stream is exhausted.
  using StreamReader = std::function<Task<std::optional<std::string>>()>;

  enum class Kind : std::uint8_t { Empty, Chunks, File, Stream };

  // Maximum size of the chunks pulled from a File body.
  static constexpr std::size_t kFileChunkSize = 64UL * 1024UL;

  HttpBody() noexcept = default;

  // Single in-memory chunk.
  explicit HttpBody(std::string content);

  static HttpBody Chunks(vector<std::string> chunks);

  static HttpBody FromFile(FileSlice slice);

  // Stream of chunks, with an optional size announced ahead of the content.
  static HttpBody Stream(StreamReader reader, std::optional<std::size_t> size = {});

  [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(_data.index()); }

  [[nodiscard]] bool isStream() const noexcept { return kind() == Kind::Stream; }

  // Number of bytes of this body if it can be known without consuming it.
  [[nodiscard]] std::optional<std::size_t> knownSize() const noexcept;

  // In-memory chunks (empty span for the other kinds).
  [[nodiscard]] std::span<const std::string> chunks() const noexcept;

  // File slice of a File body, nullptr for the other kinds.
  [[nodiscard]] const FileSlice* fileSlice() const noexcept { return std::get_if<FileSlice>(&_data); }

  // Pulls the next chunk of the body. In-memory bodies are delivered as a single chunk, file bodies in chunks of at
  // most kFileChunkSize bytes. A body is consumed by reading it, reads past its end return std::nullopt.
  Task<std::optional<std::string>> read();

  // Reads the whole body into a string, consuming it.
  Task<std::string> readAll();

 private:
  struct StreamState {
    StreamReader reader;
    std::optional<std::size_t> size;
  };

  std::variant<std::monostate, vector<std::string>, FileSlice, std::shared_ptr<StreamState>> _data;
  // Bytes of a File body already delivered.
  std::size_t _filePos{};
  bool _consumed{false};
};

}  // namespace trellis
