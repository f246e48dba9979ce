#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

#include "movecount/constants.hpp"
#include "movecount/model/analysis/pgn_reader.hpp"
#include "movecount/model/analysis/san_notation.hpp"
#include "movecount/model/chess_game.hpp"
#include "movecount/model/fen.hpp"

using namespace movecount;

static core::Square sq(char file, int rank)
{
  int f = file - 'a';
  int r = rank - 1;
  return static_cast<core::Square>(r * 8 + f);
}

static bool hasMove(const std::vector<model::Move> &moves, core::Square from, core::Square to,
                    core::PieceType promo = core::PieceType::None)
{
  return std::any_of(moves.begin(), moves.end(), [&](const model::Move &m)
                     { return m.from() == from && m.to() == to && m.promotion() == promo; });
}

int main()
{
  // Start position
  {
    model::ChessGame game;
    assert(game.setPosition(core::START_FEN));
    assert(game.generateLegalMoves().size() == 20);
    assert(game.getFen() == core::START_FEN);
    assert(!game.isKingInCheck(core::Color::White));
  }

  // Well-known move counts
  {
    model::ChessGame game;
    assert(game.setPosition("r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1"));
    const auto &moves = game.generateLegalMoves();
    assert(moves.size() == 48);
    assert(std::count_if(moves.begin(), moves.end(), [](const model::Move &m)
                         { return m.isCapture(); }) == 8);
    assert(std::count_if(moves.begin(), moves.end(), [](const model::Move &m)
                         { return m.isCastle(); }) == 2);

    assert(game.setPosition("8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1"));
    assert(game.generateLegalMoves().size() == 14);

    assert(game.setPosition("r3k2r/Pppp1ppp/1b3nbN/nP6/BBP1P3/q4N2/Pp1P2PP/R2Q1RK1 w kq - 0 1"));
    assert(game.generateLegalMoves().size() == 6);

    assert(game.setPosition("rnbq1k1r/pp1Pbppp/2p5/8/2B5/8/PPP1NnPP/RNBQK2R w KQ - 1 8"));
    assert(game.generateLegalMoves().size() == 44);
  }

  // En passant: capture is generated and removes the passed pawn
  {
    model::ChessGame game;
    assert(game.setPosition("rnbqkbnr/ppp1p1pp/8/3pPp2/8/8/PPPP1PPP/RNBQKBNR w KQkq f6 0 3"));
    const auto mv = game.getMove(sq('e', 5), sq('f', 6));
    assert(mv && mv->isEnPassant() && mv->isCapture());
    assert(game.doMove(sq('e', 5), sq('f', 6)));
    assert(!game.getPiece(sq('f', 5)));
    assert(game.getPiece(sq('f', 6))->type == core::PieceType::Pawn);
    assert(game.getFen() == "rnbqkbnr/ppp1p1pp/5P2/3p4/8/8/PPPP1PPP/RNBQKBNR b KQkq - 0 3");
  }

  // En passant square without a pawn to take is ignored
  {
    model::ChessGame game;
    assert(game.setPosition("4k3/8/8/4P3/8/8/8/4K3 w - d6 0 1"));
    assert(!hasMove(game.generateLegalMoves(), sq('e', 5), sq('d', 6)));
  }

  // Castling: both sides available, then blocked by an attacked transit square
  {
    model::ChessGame game;
    assert(game.setPosition("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1"));
    auto moves = game.generateLegalMoves();
    assert(hasMove(moves, sq('e', 1), sq('g', 1)));
    assert(hasMove(moves, sq('e', 1), sq('c', 1)));

    assert(game.setPosition("r3k2r/8/8/8/8/8/5r2/R3K2R w KQkq - 0 1"));
    moves = game.generateLegalMoves();
    assert(!hasMove(moves, sq('e', 1), sq('g', 1)));

    assert(game.setPosition("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1"));
    assert(game.doMoveUCI("e1g1"));
    assert(game.getPiece(sq('f', 1))->type == core::PieceType::Rook);
    assert(game.getFen() == "r3k2r/8/8/8/8/8/8/R4RK1 b kq - 1 1");
  }

  // Promotions in Q/R/B/N order, capture promotions flagged
  {
    model::ChessGame game;
    assert(game.setPosition("1n2k3/P7/8/8/8/8/8/4K3 w - - 0 1"));
    const auto &moves = game.generateLegalMoves();
    assert(hasMove(moves, sq('a', 7), sq('a', 8), core::PieceType::Queen));
    assert(hasMove(moves, sq('a', 7), sq('a', 8), core::PieceType::Knight));
    assert(hasMove(moves, sq('a', 7), sq('b', 8), core::PieceType::Rook));
    const auto promo = std::count_if(moves.begin(), moves.end(), [](const model::Move &m)
                                     { return m.promotion() != core::PieceType::None; });
    assert(promo == 8);
  }

  // The enemy king is never a capture target
  {
    model::ChessGame game;
    assert(game.setPosition("4k3/8/8/8/8/8/8/4K2R b - - 0 1"));
    model::Position p = game.getPosition();
    p.getState().sideToMove = core::Color::White;
    p.getBoard().setPiece(sq('e', 2), {core::PieceType::Rook, core::Color::White});
    game.setPosition(p);
    assert(!hasMove(game.generateLegalMoves(), sq('e', 2), sq('e', 8)));
  }

  // doMove/undoMove restore the position
  {
    model::Position pos;
    assert(model::parseFen("r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1",
                           pos));
    const model::Position before = pos;
    model::ChessGame game;
    game.setPosition(pos);
    for (const auto &m : game.generateLegalMoves())
    {
      assert(pos.doMove(m));
      pos.undoMove();
      assert(pos == before);
    }
  }

  // FEN parsing rejects malformed input
  {
    model::Position pos;
    std::string err;
    assert(!model::parseFen("", pos, &err) && !err.empty());
    assert(!model::parseFen("8/8/8/8/8/8/8/8 w - - 0 1", pos));
    assert(!model::parseFen("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1", pos));
    assert(!model::parseFen("rnbqkbnr/pppppppp/9/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1", pos));
    assert(model::parseFen("4k3/8/8/8/8/8/8/4K3 w - -", pos));
    assert(model::toFen(pos) == "4k3/8/8/8/8/8/8/4K3 w - - 0 1");

    model::ChessGame game;
    assert(!game.setPosition("not a fen"));
    assert(game.getFen() == core::START_FEN);
  }

  // Side-to-move flip keeps every other field
  {
    const std::string fen = "rnbqkbnr/pppp1ppp/8/4p3/4P3/8/PPPP1PPP/RNBQKBNR w KQkq e6 0 2";
    assert(model::withSideToMove(fen, core::Color::Black) ==
           "rnbqkbnr/pppp1ppp/8/4p3/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e6 0 2");
    assert(model::withSideToMove(model::withSideToMove(fen, core::Color::Black),
                                 core::Color::White) == fen);
  }

  // SAN: disambiguation, castling, check and mate suffixes
  {
    model::Position pos;
    assert(model::parseFen("r1bqkb1r/pppp1ppp/2n2n2/4p2Q/2B1P3/8/PPPP1PPP/RNB1K1NR w KQkq - 4 4",
                           pos));
    assert(model::notation::toSan(pos, model::Move(sq('h', 5), sq('f', 7), core::PieceType::None,
                                                   true)) == "Qxf7#");
    assert(model::notation::toSan(pos, model::Move(sq('c', 4), sq('f', 7), core::PieceType::None,
                                                   true)) == "Bxf7+");
    assert(model::notation::toSan(pos, model::Move(sq('a', 1), sq('a', 5))).empty());

    model::Move mv;
    assert(model::notation::fromSan(pos, "Qxf7#", mv));
    assert(mv.from() == sq('h', 5) && mv.to() == sq('f', 7));
    assert(model::notation::fromSan(pos, "g1f3", mv));
    assert(mv.from() == sq('g', 1) && mv.to() == sq('f', 3));
    assert(!model::notation::fromSan(pos, "Qa4", mv));

    assert(model::parseFen("4k3/8/8/8/8/8/8/N3K2N w - - 0 1", pos));
    assert(model::notation::toSan(pos, model::Move(sq('a', 1), sq('b', 3))) == "Nb3");
    assert(model::parseFen("4k3/8/8/8/8/8/8/1N2KN2 w - - 0 1", pos));
    assert(model::notation::toSan(pos, model::Move(sq('b', 1), sq('d', 2))) == "Nbd2");
    assert(model::notation::fromSan(pos, "Nfd2", mv) && mv.from() == sq('f', 1));
    assert(!model::notation::fromSan(pos, "Nd2", mv));

    assert(model::parseFen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1", pos));
    assert(model::notation::fromSan(pos, "0-0-0", mv) && mv.castle() == model::CastleSide::QueenSide);
    assert(model::notation::toSan(pos, mv) == "O-O-O");
  }

  // PGN replay: tags, comments, variations, NAGs, move numbers and result
  {
    const std::string pgn =
        "[Event \"Test\"]\n[White \"A\"]\n[Black \"B\"]\n[Result \"1-0\"]\n\n"
        "1. e4 {king pawn} e5 2. Bc4 $1 (2. Nf3 Nc6 (2... d6)) 2... Nc6 3. Qh5 Nf6?? ; oops\n"
        "4. Qxf7# 1-0\n";
    model::analysis::GameRecord rec;
    std::string err;
    assert(model::analysis::parsePgnToRecord(pgn, rec, &err));
    assert(rec.plies.size() == 7);
    assert(rec.result == "1-0");
    assert(rec.tags.at("White") == "A");
    assert(rec.startFen == core::START_FEN);

    assert(!model::analysis::parsePgnToRecord("1. e4 e5 2. Ke3", rec, &err));
    assert(err.find("Ke3") != std::string::npos);
  }

  // PGN with a FEN start position
  {
    const std::string pgn = "[FEN \"4k3/8/8/8/8/8/4P3/4K3 w - - 0 1\"]\n\n1. e4 Kd7 *";
    model::analysis::GameRecord rec;
    assert(model::analysis::parsePgnToRecord(pgn, rec));
    assert(rec.plies.size() == 2);
    assert(rec.result == "*");
  }

  std::cout << "rules_engine_test passed\n";
  return 0;
}
