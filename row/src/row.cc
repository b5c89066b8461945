#include "row.h"

#include <boost/endian/conversion.hpp>
#include <cstring>

Row::Row() : id(0) {
  username.fill('\0');
  email.fill('\0');
}

void SerializeRow(const Row &row, std::byte *dest) {
  u32 id_le = boost::endian::native_to_little(row.id);
  std::memcpy(dest + kIdOffset, &id_le, kIdSize);
  std::memcpy(dest + kUsernameOffset, row.username.data(), kUsernameSize);
  std::memcpy(dest + kEmailOffset, row.email.data(), kEmailSize);
}

void DeserializeRow(const std::byte *src, Row &row) {
  u32 id_le = 0;
  std::memcpy(&id_le, src + kIdOffset, kIdSize);
  row.id = boost::endian::little_to_native(id_le);
  std::memcpy(row.username.data(), src + kUsernameOffset, kUsernameSize);
  std::memcpy(row.email.data(), src + kEmailOffset, kEmailSize);
}

bool MakeRow(u32 id, const std::string &username, const std::string &email,
             Row &row) {
  if (username.size() > kUsernameSize || email.size() > kEmailSize) {
    return false;
  }
  Row made;
  made.id = id;
  std::memcpy(made.username.data(), username.data(), username.size());
  std::memcpy(made.email.data(), email.data(), email.size());
  row = made;
  return true;
}

// Stops at the first NUL without reading past the end of the column
template <std::size_t N>
static std::string ColumnToString(const std::array<char, N> &column) {
  const void *nul = std::memchr(column.data(), '\0', N);
  std::size_t length =
      nul == nullptr ? N : static_cast<const char *>(nul) - column.data();
  return std::string(column.data(), length);
}

std::string RowUsername(const Row &row) {
  return ColumnToString(row.username);
}

std::string RowEmail(const Row &row) { return ColumnToString(row.email); }

std::string ToString(const Row &row) {
  return "(" + std::to_string(row.id) + ", " + RowUsername(row) + ", " +
         RowEmail(row) + ")";
}

bool operator==(const Row &lhs, const Row &rhs) {
  return lhs.id == rhs.id && lhs.username == rhs.username &&
         lhs.email == rhs.email;
}

bool operator!=(const Row &lhs, const Row &rhs) { return !(lhs == rhs); }
