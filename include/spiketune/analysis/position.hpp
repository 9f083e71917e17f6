#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace spiketune::analysis {

// USI position body: a head ("startpos" or "sfen <board> <side> <hands> <ply>")
// followed by an ordered list of move tokens.
class Position {
 public:
  Position() = default;
  Position(std::string head, std::vector<std::string> moves)
      : head_(std::move(head)), moves_(std::move(moves)) {}

  // Accepts "startpos", "startpos moves a b", "sfen ... moves a b", with or without
  // a leading "position" keyword. Returns nullopt for an empty or headless string.
  static std::optional<Position> parse(std::string_view body);

  const std::string& head() const noexcept { return head_; }
  const std::vector<std::string>& moves() const noexcept { return moves_; }
  std::size_t ply_count() const noexcept { return moves_.size(); }

  // Drops the last k move tokens; collapses to the bare head when k >= ply_count().
  Position rewound(int k) const;

  // First move token removed by rewound(k), i.e. the move played from the rewound
  // position. Empty when k <= 0 or k > ply_count().
  std::string move_after_rewind(int k) const;

  // Position after `move`; "resign", "win" and "none" leave it unchanged.
  Position with_move(const std::string& move) const;

  // Keeps the first n moves.
  Position prefix(int n) const;

  std::string to_string() const;

  friend bool operator==(const Position& a, const Position& b) {
    return a.head_ == b.head_ && a.moves_ == b.moves_;
  }

 private:
  std::string head_;
  std::vector<std::string> moves_;
};

bool is_terminal_move(std::string_view move) noexcept;

}  // namespace spiketune::analysis
