#pragma once

#include <zobrist/zobrist_hash.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <tuple>

namespace chess {

enum class Piece : uint8_t {
    WhitePawn,
    WhiteKnight,
    WhiteBishop,
    WhiteRook,
    WhiteQueen,
    WhiteKing,
    BlackPawn,
    BlackKnight,
    BlackBishop,
    BlackRook,
    BlackQueen,
    BlackKing,
};

inline constexpr std::size_t board_size = 8;

/// An 8x8 board that keeps a Zobrist fingerprint of its pieces up to date.
/// Each occupied cell contributes the element (row, column, piece).
class ChessBoard {
  public:
    using Cell = std::tuple<std::size_t, std::size_t, Piece>;

    ChessBoard() : board_{}, zobrist_(zobrist::ZobristHash<Cell>::empty()) {}

    /// Put `piece` on (x, y), replacing whatever was there. std::nullopt
    /// clears the cell.
    void set_piece(std::size_t x, std::size_t y, std::optional<Piece> piece) {
        if (auto old_piece = board_[x][y])
            zobrist_.remove(Cell{x, y, *old_piece});
        if (piece)
            zobrist_.add(Cell{x, y, *piece});
        board_[x][y] = piece;
    }

    std::optional<Piece> piece_at(std::size_t x, std::size_t y) const {
        return board_[x][y];
    }

    /// Standard opening position: white on rows 0-1, black on rows 6-7.
    void initialize() {
        static constexpr std::array<Piece, board_size> white_back = {
            Piece::WhiteRook,  Piece::WhiteKnight, Piece::WhiteBishop,
            Piece::WhiteQueen, Piece::WhiteKing,   Piece::WhiteBishop,
            Piece::WhiteKnight, Piece::WhiteRook};
        static constexpr std::array<Piece, board_size> black_back = {
            Piece::BlackRook,  Piece::BlackKnight, Piece::BlackBishop,
            Piece::BlackQueen, Piece::BlackKing,   Piece::BlackBishop,
            Piece::BlackKnight, Piece::BlackRook};

        for (std::size_t i = 0; i < board_size; ++i) {
            set_piece(0, i, white_back[i]);
            set_piece(1, i, Piece::WhitePawn);
        }
        for (std::size_t i = 0; i < board_size; ++i) {
            set_piece(7, i, black_back[i]);
            set_piece(6, i, Piece::BlackPawn);
        }
    }

    uint64_t hash() const { return static_cast<uint64_t>(zobrist_); }

  private:
    std::array<std::array<std::optional<Piece>, board_size>, board_size> board_;
    zobrist::ZobristHash<Cell> zobrist_;
};

} // namespace chess
