#pragma once

/*
 * sql_int.h
 *
 * This file contains the definitions of various integer types used in the database
 */

// Unsigned integers
typedef unsigned long long int u64;
typedef unsigned int u32;
typedef unsigned short int u16;
typedef unsigned char u8;

// Commonly used types

// Zero-based index of a page in the database file
typedef u32 PageNumber;
