#pragma once

#include <stdint.h>

namespace neostrip {
namespace core {

enum class ConsoleCommandKind : uint8_t { Help, On, Off, Set, Get, Dump };

struct ConsoleCommand {
  ConsoleCommandKind kind = ConsoleCommandKind::Help;
  int32_t index = 0;            // Set, Get
  const char* color = nullptr;  // On, Set; points into the parsed line
};

// Parses one console line in place (the line is modified):
//   on <color> | off | set <index> <color> | get <index> | dump | help
// The color argument is the remainder of the line, so "rgb(1, 2, 3)" works.
// Returns false for blank, unknown or malformed lines.
bool parse_console_command(char* line, ConsoleCommand* out);

const char* console_command_name(ConsoleCommandKind kind);

}  // namespace core
}  // namespace neostrip
