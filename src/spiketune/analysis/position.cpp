#include "spiketune/analysis/position.hpp"

#include <algorithm>
#include <sstream>

namespace spiketune::analysis {

bool is_terminal_move(std::string_view move) noexcept {
  return move.empty() || move == "resign" || move == "win" || move == "none" ||
         move == "(none)";
}

std::optional<Position> Position::parse(std::string_view body) {
  std::vector<std::string> tok;
  {
    std::istringstream is{std::string(body)};
    std::string t;
    while (is >> t) tok.push_back(std::move(t));
  }
  std::size_t i = 0;
  if (i < tok.size() && tok[i] == "position") ++i;
  if (i >= tok.size() || tok[i] == "moves") return std::nullopt;

  const auto movesIt = std::find(tok.begin() + static_cast<std::ptrdiff_t>(i), tok.end(), "moves");
  std::string head;
  for (auto it = tok.begin() + static_cast<std::ptrdiff_t>(i); it != movesIt; ++it) {
    if (!head.empty()) head.push_back(' ');
    head += *it;
  }
  std::vector<std::string> moves;
  if (movesIt != tok.end()) moves.assign(movesIt + 1, tok.end());
  return Position(std::move(head), std::move(moves));
}

Position Position::rewound(int k) const {
  if (k <= 0) return *this;
  const std::size_t drop = static_cast<std::size_t>(k);
  if (drop >= moves_.size()) return Position(head_, {});
  return Position(head_, std::vector<std::string>(moves_.begin(), moves_.end() - static_cast<std::ptrdiff_t>(drop)));
}

std::string Position::move_after_rewind(int k) const {
  if (k <= 0 || static_cast<std::size_t>(k) > moves_.size()) return {};
  return moves_[moves_.size() - static_cast<std::size_t>(k)];
}

Position Position::with_move(const std::string& move) const {
  if (is_terminal_move(move)) return *this;
  Position p = *this;
  p.moves_.push_back(move);
  return p;
}

Position Position::prefix(int n) const {
  if (n < 0) n = 0;
  const std::size_t keep = std::min(moves_.size(), static_cast<std::size_t>(n));
  return Position(head_, std::vector<std::string>(moves_.begin(), moves_.begin() + static_cast<std::ptrdiff_t>(keep)));
}

std::string Position::to_string() const {
  std::string s = head_;
  if (!moves_.empty()) {
    s += " moves";
    for (const auto& m : moves_) {
      s.push_back(' ');
      s += m;
    }
  }
  return s;
}

}  // namespace spiketune::analysis
