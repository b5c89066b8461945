#pragma once

#include "sql_int.h"

/*
 * sql_limit.h
 *
 * This file contains the definitions of various limits used in the database.
 * Layout arithmetic in derived_page depends on these values at compile time.
 */

// Size of a page in bytes. It is both the unit of disk I/O and of caching.
constexpr u32 kPageSize = 4096;

// Default capacity of a Pager's page table. A Pager never holds more pages
// than this, and the database file never grows past it.
constexpr u32 kTableMaxPages = 100;

// On-disk sentinel for "no next leaf" and "no parent".
// Page 0 always holds the leftmost leaf, so it is never anyone's next leaf,
// and the root is identified by its is_root flag rather than its parent.
constexpr PageNumber kNoPage = 0;

// Column widths of the table schema
constexpr u32 kColumnUsernameSize = 32;
constexpr u32 kColumnEmailSize = 255;
