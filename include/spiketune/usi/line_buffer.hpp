#pragma once

#include <cstddef>
#include <string>

namespace spiketune::usi
{
  // Accumulates raw bytes read from a pipe and hands out complete lines.
  // The trailing partial line stays buffered until its newline arrives.
  class LineBuffer
  {
  public:
    void append(const char *data, std::size_t n);

    // Pops the next complete line (CR/LF stripped). Returns false if none is complete yet.
    bool popLine(std::string &outLine);

    // Takes the unterminated remainder, used once the stream reached EOF.
    bool takeRemainder(std::string &outLine);

    std::size_t pendingBytes() const noexcept { return m_buf.size() - m_start; }
    void clear() noexcept;

  private:
    std::string m_buf;
    std::size_t m_start{0};
  };
} // namespace spiketune::usi
