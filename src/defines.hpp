#pragma once


// Compare the attribute_length declared by each attribute against the number
// of bytes its body actually consumed. Without the check, a malformed length
// goes unnoticed as long as the body itself parses.
#ifndef CLASSDEC_CHECK_ATTRIBUTE_LENGTH
#define CLASSDEC_CHECK_ATTRIBUTE_LENGTH 1
#endif


// The fourth byte of a six-byte supplementary character is always 0xED. Set
// to zero to accept whatever value sits there.
#ifndef CLASSDEC_CHECK_SURROGATE_MARKER
#define CLASSDEC_CHECK_SURROGATE_MARKER 1
#endif


// A classfile ends after its attributes table, anything following it is an
// error.
#ifndef CLASSDEC_REJECT_TRAILING_BYTES
#define CLASSDEC_REJECT_TRAILING_BYTES 1
#endif


// How deeply element values and attribute tables may nest inside one another
// before the decoder gives up on the classfile.
#ifndef CLASSDEC_MAX_NESTING_DEPTH
#define CLASSDEC_MAX_NESTING_DEPTH 256
#endif
