/**
* @file   types.h
* @brief  Core types for the basics library
*/

#ifndef BASICS_TYPES_H
#define BASICS_TYPES_H

typedef signed long long basics_long_t; /**< Signed quad word type */
typedef const char* basics_cstring_t; /**< Constant string type */
typedef void* basics_pointer_t; /**< Pointer type */

#endif
