#include "chess_board.hpp"

#include <cinttypes>
#include <cstdio>

using chess::ChessBoard;
using chess::Piece;

int main() {
    ChessBoard board;
    board.initialize();

    const uint64_t initial_hash = board.hash();
    std::printf("initial position:     %016" PRIx64 "\n", initial_hash);
    if (initial_hash == 0) {
        std::fprintf(stderr, "FAIL: opening position hashed to zero\n");
        return 1;
    }

    board.set_piece(1, 0, std::nullopt);
    const uint64_t hash_after_move = board.hash();
    std::printf("pawn (1,0) removed:   %016" PRIx64 "\n", hash_after_move);
    if (hash_after_move == initial_hash) {
        std::fprintf(stderr, "FAIL: removing a pawn left the hash unchanged\n");
        return 1;
    }

    // Restore the white pawn
    board.set_piece(1, 0, Piece::WhitePawn);
    const uint64_t hash_after_reset = board.hash();
    std::printf("pawn (1,0) restored:  %016" PRIx64 "\n", hash_after_reset);
    if (hash_after_reset != initial_hash) {
        std::fprintf(stderr, "FAIL: restored position hashed differently\n");
        return 1;
    }

    std::printf("OK\n");
    return 0;
}
