#include "gambit/model/fen.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace gambit::model::fen {

namespace {

bool isValidBoard(const std::string& boardField) {
  int rankCount = 0;
  std::size_t i = 0;
  while (i < boardField.size()) {
    int fileSum = 0;
    while (i < boardField.size() && boardField[i] != '/') {
      const char c = boardField[i++];
      if (std::isdigit(static_cast<unsigned char>(c))) {
        const int n = c - '0';
        if (n <= 0 || n > 8) return false;
        fileSum += n;
      } else {
        switch (c) {
          case 'p':
          case 'r':
          case 'n':
          case 'b':
          case 'q':
          case 'k':
          case 'P':
          case 'R':
          case 'N':
          case 'B':
          case 'Q':
          case 'K':
            ++fileSum;
            break;
          default:
            return false;
        }
      }
      if (fileSum > 8) return false;
    }
    if (fileSum != 8) return false;
    ++rankCount;
    if (i < boardField.size() && boardField[i] == '/') ++i;
  }
  return rankCount == 8;
}

bool isCastlingFieldValid(const std::string& field) {
  if (field == "-") return true;
  std::string seen;
  for (char c : field) {
    if (c != 'K' && c != 'Q' && c != 'k' && c != 'q') return false;
    if (seen.find(c) != std::string::npos) return false;
    seen += c;
  }
  return true;
}

// The target sits behind a pawn of the side that just moved.
bool isEnPassantFieldValid(const std::string& field, const std::string& sideToMove) {
  if (field == "-") return true;
  if (field.size() != 2) return false;
  if (field[0] < 'a' || field[0] > 'h') return false;
  return field[1] == (sideToMove == "w" ? '6' : '3');
}

bool isNonNegativeInteger(const std::string& field) {
  if (field.empty() || field.size() > 9) return false;
  for (char c : field)
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  return true;
}

// Counters must fit GameState unchanged, or the FEN would not round-trip.
bool isCounterInRange(const std::string& field, unsigned long lo, unsigned long hi) {
  if (!isNonNegativeInteger(field)) return false;
  const unsigned long v = std::stoul(field);
  return v >= lo && v <= hi;
}

core::PieceType typeFromChar(char ch) {
  switch (std::tolower(static_cast<unsigned char>(ch))) {
    case 'p':
      return core::PieceType::Pawn;
    case 'n':
      return core::PieceType::Knight;
    case 'b':
      return core::PieceType::Bishop;
    case 'r':
      return core::PieceType::Rook;
    case 'q':
      return core::PieceType::Queen;
    case 'k':
      return core::PieceType::King;
    default:
      throw std::runtime_error("invalid piece character in FEN: " + std::string(1, ch));
  }
}

char charFromPiece(const Piece& p) {
  static constexpr char kLetters[] = {'p', 'n', 'b', 'r', 'q', 'k'};
  const char c = kLetters[static_cast<int>(p.type)];
  return p.color == core::Color::White
             ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
             : c;
}

}  // namespace

bool isFenWellFormed(const std::string& fen) {
  std::istringstream ss(fen);
  std::string fields[6];
  for (auto& f : fields)
    if (!(ss >> f)) return false;
  std::string extra;
  if (ss >> extra) return false;

  if (!isValidBoard(fields[0])) return false;
  if (!(fields[1] == "w" || fields[1] == "b")) return false;
  if (!isCastlingFieldValid(fields[2])) return false;
  if (!isEnPassantFieldValid(fields[3], fields[1])) return false;
  return isCounterInRange(fields[4], 0, std::numeric_limits<std::uint16_t>::max()) &&
         isCounterInRange(fields[5], 1, std::numeric_limits<std::uint32_t>::max());
}

Position parse(const std::string& fen) {
  if (!isFenWellFormed(fen)) throw std::runtime_error("malformed FEN: \"" + fen + "\"");

  std::istringstream iss(fen);
  std::string board, activeColor, castling, enPassant, halfmoveClock, fullmoveNumber;
  iss >> board >> activeColor >> castling >> enPassant >> halfmoveClock >> fullmoveNumber;

  Position pos;
  Board& b = pos.getBoard();
  b.clear();

  // FEN lists rank 8 first, which is row 0 here
  int row = 0;
  int col = 0;
  for (char ch : board) {
    if (ch == '/') {
      ++row;
      col = 0;
    } else if (std::isdigit(static_cast<unsigned char>(ch))) {
      col += ch - '0';
    } else {
      const core::Color c =
          std::isupper(static_cast<unsigned char>(ch)) ? core::Color::White : core::Color::Black;
      b.setPiece(core::to_square(row, col), Piece{typeFromChar(ch), c});
      ++col;
    }
  }

  GameState& st = pos.getState();
  st.sideToMove = (activeColor == "w" ? core::Color::White : core::Color::Black);

  std::uint8_t rights = 0;
  if (castling.find('K') != std::string::npos) rights |= Castling::WK;
  if (castling.find('Q') != std::string::npos) rights |= Castling::WQ;
  if (castling.find('k') != std::string::npos) rights |= Castling::BK;
  if (castling.find('q') != std::string::npos) rights |= Castling::BQ;
  st.castlingRights = rights;

  st.enPassantSquare = (enPassant == "-") ? core::NO_SQUARE : core::squareFromName(enPassant);
  st.halfmoveClock = static_cast<std::uint16_t>(std::stoul(halfmoveClock));
  st.fullmoveNumber = static_cast<std::uint32_t>(std::stoul(fullmoveNumber));
  return pos;
}

std::string serialize(const Position& pos) {
  std::ostringstream os;
  const Board& b = pos.getBoard();
  for (int row = 0; row < core::BOARD_SIZE; ++row) {
    int empty = 0;
    for (int col = 0; col < core::BOARD_SIZE; ++col) {
      const auto p = b.getPiece(core::to_square(row, col));
      if (!p) {
        ++empty;
        continue;
      }
      if (empty) {
        os << empty;
        empty = 0;
      }
      os << charFromPiece(*p);
    }
    if (empty) os << empty;
    if (row != core::BOARD_SIZE - 1) os << '/';
  }

  const GameState& st = pos.getState();
  os << ' ' << (st.sideToMove == core::Color::White ? 'w' : 'b') << ' ';

  std::string rights;
  if (st.castlingRights & Castling::WK) rights += 'K';
  if (st.castlingRights & Castling::WQ) rights += 'Q';
  if (st.castlingRights & Castling::BK) rights += 'k';
  if (st.castlingRights & Castling::BQ) rights += 'q';
  os << (rights.empty() ? "-" : rights) << ' ';

  os << core::squareName(st.enPassantSquare) << ' ' << st.halfmoveClock << ' '
     << st.fullmoveNumber;
  return os.str();
}

}  // namespace gambit::model::fen
