#include "instructions.hpp"

namespace z3n {

namespace {

constexpr std::string_view k_instructions = R"(# z3n patch format

A patch is plain UTF-8 text. It describes edits to one or more files. The edits are located by
their content, not by line numbers, so copy the surrounding lines exactly as they appear in the file.

## Envelope

    *** Begin Patch
    ... one or more file actions ...
    *** End Patch

## File actions

Create a file. Every body line starts with '+'. The path must not exist yet.

    *** Add File: path/to/new_file.txt
    +first line
    +second line

Delete a file. Every body line starts with '-' and the lines must be the file's whole current
content, so the deletion is only carried out on the file you expect.

    *** Delete File: path/to/old_file.txt
    -only line of the file

Edit a file. The body is one or more hunks, each introduced by '@@' (text after '@@' is a label
for humans and is ignored). An optional '*** Move to:' line directly after the header renames the
file once the edits are made.

    *** Update File: src/app.cpp
    *** Move to: src/main.cpp
    @@ int main
     int main() {
    -  return 1;
    +  return 0;
     }

## Hunk lines

    ' ' (one space)  context: a line that stays as it is
    '-'              a line to remove
    '+'              a line to add

Every hunk line needs one of these prefixes, blank context lines included (a single space).
The context and '-' lines of a hunk, in order, must appear as one contiguous run in the file.

## How hunks are located

- Hunks in one Update are applied top to bottom; each hunk is searched for only below the
  previous one's edit. Write hunks in file order and do not let them overlap.
- Matching tries exact text first, then ignores trailing whitespace, then ignores leading and
  repeated whitespace and typographic quotes, dashes and non-breaking spaces.
- A hunk must match exactly one place. If it matches several places, the patch is rejected:
  add more context lines until the location is unique. A hunk with only '+' lines has nothing
  to anchor it and is rejected; include at least one context line.
- If any hunk or action fails, nothing is changed at all.
)";

} // namespace

std::string_view instructions() noexcept { return k_instructions; }

} // namespace z3n
