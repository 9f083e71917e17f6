#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace spiketune::usi
{
  // Mate readings are folded into the centipawn scale with this magnitude.
  inline constexpr int kMateScoreCp = 100000;

  using OptionValue = std::variant<bool, int, std::string>;

  inline bool startsWith(std::string_view s, std::string_view pfx) noexcept
  {
    return s.substr(0, pfx.size()) == pfx;
  }

  inline std::vector<std::string> splitWs(const std::string &s)
  {
    std::vector<std::string> v;
    std::istringstream is(s);
    std::string t;
    while (is >> t)
      v.push_back(std::move(t));
    return v;
  }

  inline std::string trim(std::string_view s)
  {
    const auto a = s.find_first_not_of(" \t\r\n");
    if (a == std::string_view::npos)
      return {};
    const auto b = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(a, b - a + 1));
  }

  // Strict signed integer parse; rejects trailing garbage and values outside long long.
  inline std::optional<long long> parseInt(std::string_view sv) noexcept
  {
    if (sv.empty())
      return std::nullopt;
    std::size_t i = 0;
    bool neg = false;
    if (sv[0] == '-' || sv[0] == '+')
    {
      neg = sv[0] == '-';
      i = 1;
    }
    if (i >= sv.size())
      return std::nullopt;
    // Accumulate negatively so LLONG_MIN stays representable.
    constexpr long long kMin = std::numeric_limits<long long>::min();
    long long val = 0;
    for (; i < sv.size(); ++i)
    {
      const char c = sv[i];
      if (c < '0' || c > '9')
        return std::nullopt;
      const int d = c - '0';
      if (val < (kMin + d) / 10)
        return std::nullopt;
      val = val * 10 - d;
    }
    if (!neg)
    {
      if (val == kMin)
        return std::nullopt;
      return -val;
    }
    return val;
  }

  // parseInt narrowed to int; out-of-range values are rejected, never wrapped.
  inline std::optional<int> parseInt32(std::string_view sv) noexcept
  {
    const auto v = parseInt(sv);
    if (!v || *v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max())
      return std::nullopt;
    return static_cast<int>(*v);
  }

  inline int normalizeMate(long long mate) noexcept
  {
    return mate > 0 ? kMateScoreCp : -kMateScoreCp;
  }

  // "score mate <n>" operand, including the bare "+" / "-" forms.
  inline std::optional<int> parseMate(std::string_view sv) noexcept
  {
    if (sv == "+")
      return kMateScoreCp;
    if (sv == "-")
      return -kMateScoreCp;
    if (const auto v = parseInt(sv))
      return normalizeMate(*v);
    return std::nullopt;
  }

  inline std::string formatOptionValue(const OptionValue &v)
  {
    if (std::holds_alternative<bool>(v))
      return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<int>(v))
      return std::to_string(std::get<int>(v));
    return std::get<std::string>(v);
  }

  // One parsed "info ..." line. Fields the engine did not print stay empty.
  struct InfoLine
  {
    std::optional<int> depth;
    std::optional<int> seldepth;
    std::optional<int> scoreCp; // mate already normalized
    bool mate{false};
    int multipv{1};
    std::optional<std::uint64_t> nodes;
    std::optional<std::uint64_t> nps;
  };

  inline std::optional<InfoLine> parseInfoLine(const std::string &line)
  {
    const auto tok = splitWs(line);
    if (tok.empty() || tok[0] != "info")
      return std::nullopt;

    InfoLine info;
    for (std::size_t i = 1; i + 1 < tok.size(); ++i)
    {
      const std::string &key = tok[i];
      if (key == "pv" || key == "string")
        break;
      if (key == "depth")
      {
        if (auto v = parseInt32(tok[i + 1]))
          info.depth = *v;
        ++i;
      }
      else if (key == "seldepth")
      {
        if (auto v = parseInt32(tok[i + 1]))
          info.seldepth = *v;
        ++i;
      }
      else if (key == "multipv")
      {
        if (auto v = parseInt32(tok[i + 1]))
          info.multipv = *v;
        ++i;
      }
      else if (key == "nodes")
      {
        if (auto v = parseInt(tok[i + 1]); v && *v >= 0)
          info.nodes = static_cast<std::uint64_t>(*v);
        ++i;
      }
      else if (key == "nps")
      {
        if (auto v = parseInt(tok[i + 1]); v && *v >= 0)
          info.nps = static_cast<std::uint64_t>(*v);
        ++i;
      }
      else if (key == "score" && i + 2 < tok.size())
      {
        if (tok[i + 1] == "cp")
        {
          info.scoreCp = parseInt32(tok[i + 2]);
        }
        else if (tok[i + 1] == "mate")
        {
          info.scoreCp = parseMate(tok[i + 2]);
          info.mate = info.scoreCp.has_value();
        }
        i += 2;
      }
    }
    return info;
  }

  // "bestmove <mv> [ponder <mv>]" -> <mv>
  inline std::optional<std::string> parseBestmove(const std::string &line)
  {
    const auto tok = splitWs(line);
    if (tok.size() < 2 || tok[0] != "bestmove")
      return std::nullopt;
    return tok[1];
  }

  // "option name <name with spaces> type ..." -> <name>
  inline std::optional<std::string> parseOptionName(const std::string &line)
  {
    if (!startsWith(line, "option "))
      return std::nullopt;
    const std::string keyName = " name ";
    const std::string keyType = " type ";
    const auto namePos = line.find(keyName);
    if (namePos == std::string::npos)
      return std::nullopt;
    const auto begin = namePos + keyName.size();
    const auto typePos = line.find(keyType, begin);
    std::string name = trim(line.substr(begin, typePos == std::string::npos ? std::string::npos : typePos - begin));
    if (name.empty())
      return std::nullopt;
    return name;
  }

} // namespace spiketune::usi
