#include <Arduino.h>

#include "core/console_command.h"
#include "core/status.h"
#include "core/strip.h"
#include "core/strip_config.h"
#include "platform/led/dotstar_output.h"

namespace {

constexpr char kFirmwareVersion[] = "neostrip-0.1.0";

const neostrip::core::StripConfig& config = neostrip::core::kStripConfig;

neostrip::core::Strip strip{config.pixel_count};
neostrip::platform::DotstarOutput led_out{config};
neostrip::platform::PerfStats stats{0, 0};

char line[neostrip::core::kConsoleLineCapacity];
size_t line_len = 0;
bool line_overflow = false;

uint32_t last_stats_ms = 0;

void print_rgb(const neostrip::core::Rgb& c) {
  Serial.print("(");
  Serial.print(static_cast<unsigned>(c.r));
  Serial.print(",");
  Serial.print(static_cast<unsigned>(c.g));
  Serial.print(",");
  Serial.print(static_cast<unsigned>(c.b));
  Serial.print(")");
}

void print_status(const char* what, neostrip::core::Status s) {
  Serial.print(what);
  Serial.print(": ");
  Serial.println(neostrip::core::status_name(s));
}

void print_help() {
  Serial.println("Commands:");
  Serial.println("  on <color>          fill the strip");
  Serial.println("  off                 all pixels black");
  Serial.println("  set <index> <color> set one pixel");
  Serial.println("  get <index>         print one pixel");
  Serial.println("  dump                print every pixel");
  Serial.println("Colors: #rrggbb, #rgb, rgb(r,g,b), hsl(h,s%,l%), CSS names");
}

void push_frame() {
  const uint32_t frame_start_ms = millis();
  if (!led_out.show(strip.buffer(), strip.buffer_size(), &stats)) {
    Serial.println("LED output rejected frame");
    return;
  }
  stats.frame_ms = millis() - frame_start_ms;
}

void print_pixel(int32_t index) {
  neostrip::core::Rgb c = neostrip::core::kBlack;
  const neostrip::core::Status s = strip.get_pixel_color(index, &c);
  if (!neostrip::core::ok(s)) {
    print_status("get", s);
    return;
  }
  Serial.print("pixel=");
  Serial.print(index);
  Serial.print(" rgb=");
  print_rgb(c);
  Serial.println();
}

void run_command(const neostrip::core::ConsoleCommand& cmd) {
  using neostrip::core::ConsoleCommandKind;
  const char* name = neostrip::core::console_command_name(cmd.kind);

  switch (cmd.kind) {
    case ConsoleCommandKind::Help:
      print_help();
      return;
    case ConsoleCommandKind::On: {
      const neostrip::core::Status s = strip.on(cmd.color);
      print_status(name, s);
      if (neostrip::core::ok(s)) push_frame();
      return;
    }
    case ConsoleCommandKind::Off:
      strip.off();
      print_status(name, neostrip::core::Status::Ok);
      push_frame();
      return;
    case ConsoleCommandKind::Set: {
      const neostrip::core::Status s = strip.set_pixel_color(cmd.index, cmd.color);
      print_status(name, s);
      if (neostrip::core::ok(s)) push_frame();
      return;
    }
    case ConsoleCommandKind::Get:
      print_pixel(cmd.index);
      return;
    case ConsoleCommandKind::Dump:
      for (size_t i = 0; i < strip.pixel_count(); ++i) {
        print_pixel(static_cast<int32_t>(i));
      }
      return;
  }
}

void handle_line() {
  line[line_len] = '\0';
  neostrip::core::ConsoleCommand cmd;
  if (neostrip::core::parse_console_command(line, &cmd)) {
    run_command(cmd);
  } else if (line_len > 0) {
    Serial.println("Unknown command (try 'help')");
  }
}

void poll_console() {
  while (Serial.available() > 0) {
    const int c = Serial.read();
    if (c < 0) {
      return;
    }
    if (c == '\r' || c == '\n') {
      if (line_overflow) {
        Serial.println("Line too long, dropped");
      } else {
        handle_line();
      }
      line_len = 0;
      line_overflow = false;
      continue;
    }
    if (line_len + 1 >= sizeof(line)) {
      line_overflow = true;
      continue;
    }
    line[line_len++] = static_cast<char>(c);
  }
}

}  // namespace

void setup() {
  Serial.begin(neostrip::core::kSerialBaud);
  delay(200);

  Serial.println();
  Serial.print("neostrip ");
  Serial.println(kFirmwareVersion);
  Serial.print("pixels=");
  Serial.print(static_cast<unsigned>(strip.pixel_count()));
  Serial.print(" data_pin=");
  Serial.print(static_cast<unsigned>(config.data_pin));
  Serial.print(" clock_pin=");
  Serial.print(static_cast<unsigned>(config.clock_pin));
  Serial.print(" default_color=");
  Serial.println(config.default_color);

  if (!led_out.begin()) {
    Serial.println("LED output init failed");
  }

  const neostrip::core::Status s = strip.on(config.default_color);
  if (!neostrip::core::ok(s)) {
    print_status("default color", s);
    strip.off();
  }
  push_frame();
  print_help();
}

void loop() {
  poll_console();

  const uint32_t now_ms = millis();
  if (static_cast<int32_t>(now_ms - last_stats_ms) >= static_cast<int32_t>(neostrip::core::kStatsIntervalMs)) {
    last_stats_ms = now_ms;
    Serial.print("pixels=");
    Serial.print(static_cast<unsigned>(strip.pixel_count()));
    Serial.print(" flush_ms=");
    Serial.print(stats.flush_ms);
    Serial.print(" frame_ms=");
    Serial.println(stats.frame_ms);
  }
}
