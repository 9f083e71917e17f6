#include "spiketune/usi/line_buffer.hpp"

namespace spiketune::usi
{
  static void trimLineEnd(std::string &s)
  {
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n'))
      s.pop_back();
  }

  void LineBuffer::append(const char *data, std::size_t n)
  {
    // compact consumed prefix before growing
    if (m_start > 0 && m_start * 2 >= m_buf.size())
    {
      m_buf.erase(0, m_start);
      m_start = 0;
    }
    m_buf.append(data, n);
  }

  bool LineBuffer::popLine(std::string &outLine)
  {
    const auto pos = m_buf.find('\n', m_start);
    if (pos == std::string::npos)
      return false;

    outLine.assign(m_buf, m_start, pos - m_start);
    trimLineEnd(outLine);
    m_start = pos + 1;
    if (m_start == m_buf.size())
    {
      m_buf.clear();
      m_start = 0;
    }
    return true;
  }

  bool LineBuffer::takeRemainder(std::string &outLine)
  {
    if (pendingBytes() == 0)
      return false;
    outLine.assign(m_buf, m_start, std::string::npos);
    trimLineEnd(outLine);
    clear();
    return true;
  }

  void LineBuffer::clear() noexcept
  {
    m_buf.clear();
    m_start = 0;
  }
} // namespace spiketune::usi
