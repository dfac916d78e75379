#include "console_command.h"

#include <ctype.h>
#include <string.h>

namespace neostrip {
namespace core {

namespace {

constexpr int64_t kMaxIndexMagnitude = 0x7FFFFFFF;

struct CommandName {
  const char* name;
  ConsoleCommandKind kind;
};

constexpr CommandName kCommands[] = {
    {"help", ConsoleCommandKind::Help},
    {"on", ConsoleCommandKind::On},
    {"off", ConsoleCommandKind::Off},
    {"set", ConsoleCommandKind::Set},
    {"get", ConsoleCommandKind::Get},
    {"dump", ConsoleCommandKind::Dump},
};

char* skip_spaces(char* p) {
  while (*p != '\0' && isspace(static_cast<unsigned char>(*p))) ++p;
  return p;
}

// Splits off the next whitespace-delimited token. Returns its start, and
// leaves *rest pointing at the remainder.
char* next_token(char* p, char** rest) {
  p = skip_spaces(p);
  char* start = p;
  while (*p != '\0' && !isspace(static_cast<unsigned char>(*p))) ++p;
  if (*p != '\0') {
    *p = '\0';
    ++p;
  }
  *rest = p;
  return start;
}

void trim_trailing(char* p) {
  size_t len = strlen(p);
  while (len > 0 && isspace(static_cast<unsigned char>(p[len - 1]))) {
    p[--len] = '\0';
  }
}

bool parse_index(const char* s, int32_t* out) {
  bool negative = false;
  if (*s == '-' || *s == '+') {
    negative = *s == '-';
    ++s;
  }
  if (*s == '\0') return false;

  int64_t v = 0;
  for (; *s != '\0'; ++s) {
    if (!isdigit(static_cast<unsigned char>(*s))) return false;
    v = v * 10 + (*s - '0');
    if (v > kMaxIndexMagnitude) return false;
  }
  *out = static_cast<int32_t>(negative ? -v : v);
  return true;
}

bool lookup_command(const char* token, ConsoleCommandKind* out) {
  for (const CommandName& c : kCommands) {
    if (strcmp(c.name, token) == 0) {
      *out = c.kind;
      return true;
    }
  }
  return false;
}

}  // namespace

bool parse_console_command(char* line, ConsoleCommand* out) {
  if (line == nullptr || out == nullptr) {
    return false;
  }

  char* rest = nullptr;
  char* word = next_token(line, &rest);
  if (*word == '\0') {
    return false;
  }
  for (char* p = word; *p != '\0'; ++p) {
    *p = static_cast<char>(tolower(static_cast<unsigned char>(*p)));
  }

  ConsoleCommand cmd;
  if (!lookup_command(word, &cmd.kind)) {
    return false;
  }

  if (cmd.kind == ConsoleCommandKind::Set || cmd.kind == ConsoleCommandKind::Get) {
    char* index = next_token(rest, &rest);
    if (*index == '\0' || !parse_index(index, &cmd.index)) {
      return false;
    }
  }

  rest = skip_spaces(rest);
  trim_trailing(rest);

  if (cmd.kind == ConsoleCommandKind::On || cmd.kind == ConsoleCommandKind::Set) {
    if (*rest == '\0') {
      return false;
    }
    cmd.color = rest;
  } else if (*rest != '\0') {
    return false;
  }

  *out = cmd;
  return true;
}

const char* console_command_name(ConsoleCommandKind kind) {
  for (const CommandName& c : kCommands) {
    if (c.kind == kind) return c.name;
  }
  return "?";
}

}  // namespace core
}  // namespace neostrip
