#pragma once

namespace contentflow::url {

// Decodes within the provided buffer, compacting percent-encoded sequences and translating '+' to 'plusAs'.
// Returns nullptr on invalid encoding (truncated % or non-hex digits) when strictInvalid is true, leaving the
// buffer in an unspecified partially modified state. Otherwise invalid sequences are kept verbatim.
// Returns a pointer to the new logical end of the decoded sequence.
char* DecodeInPlace(char* first, const char* last, char plusAs = '+', bool strictInvalid = true);

}  // namespace contentflow::url
