/**
* @file   types.h
* @brief  Core types for the latexerr library
*/

#ifndef LATEXERR_TYPES_H
#define LATEXERR_TYPES_H

typedef signed int latexerr_int_t; /**< Signed double word type */
typedef char latexerr_char_t; /**< Character type */
typedef char* latexerr_string_t; /**< String type */
typedef const char* latexerr_cstring_t; /**< Constant string type */
typedef void* latexerr_pointer_t; /**< Pointer type */

#endif
