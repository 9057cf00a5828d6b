// Copyright 2026 The skitch Authors
//
// skitch_cli -- headless scripted annotation session.
//
// Reads commands (one per line) from a script file, or stdin when the path
// is "-" or omitted, and applies them to a skitch editing session:
//
//   new [W H]                 blank canvas
//   open PATH                 load an image as the document
//   save PATH [QUALITY]       render and write (format from extension)
//   color AARRGGBB            current tool color (hex)
//   width W                   current stroke width
//   rect X Y W H
//   arrow X1 Y1 X2 Y2
//   stroke X Y X Y ...
//   text X Y WORDS...
//   move ID DX DY
//   remove ID
//   crop X Y W H
//   mosaic X Y W H
//   flush                     capture pending changes now
//   undo | redo
//   wait MS                   pump timers for MS milliseconds
//   info                      print document and history state
//
// Lines starting with '#' are ignored.

#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "skitch/skitch.hpp"

namespace {

SkitchImageFormat FormatForPath(const std::string& path) {
  auto dot = path.find_last_of('.');
  std::string ext = dot == std::string::npos ? "" : path.substr(dot + 1);
  for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (ext == "jpg" || ext == "jpeg") return kSkitchImageFormatJpeg;
  if (ext == "bmp") return kSkitchImageFormatBmp;
  return kSkitchImageFormatPng;
}

void PrintInfo(skitch::Context& ctx) {
  SkitchHistoryInfo info = ctx.history_info();
  std::printf("document %dx%d, %d objects%s\n", ctx.width(), ctx.height(),
              ctx.object_count(), ctx.modified() ? " (modified)" : "");
  std::printf("history undo=%d redo=%d top=%lld%s%s\n", info.undo_depth,
              info.redo_depth, static_cast<long long>(info.top_id),
              info.locked ? " locked" : "",
              info.degraded ? " degraded" : "");
}

void Pump(skitch::Context& ctx, int ms) {
  auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
  while (std::chrono::steady_clock::now() < until) {
    ctx.ProcessEvents(10);
  }
}

// Returns false for unknown commands or missing arguments.
bool RunCommand(skitch::Context& ctx, const std::string& line) {
  std::istringstream in(line);
  std::string cmd;
  in >> cmd;
  if (cmd.empty() || cmd[0] == '#') return true;

  if (cmd == "new") {
    int w = 0, h = 0;
    in >> w >> h;
    ctx.NewDocument(w, h);
  } else if (cmd == "open") {
    std::string path;
    if (!(in >> path)) return false;
    ctx.OpenFile(path.c_str());
  } else if (cmd == "save") {
    std::string path;
    int quality = 0;
    if (!(in >> path)) return false;
    in >> quality;
    ctx.SaveFile(path.c_str(), FormatForPath(path), quality);
    std::printf("saved %s\n", path.c_str());
  } else if (cmd == "color") {
    std::string hex;
    if (!(in >> hex)) return false;
    ctx.SetColor(static_cast<uint32_t>(std::strtoul(hex.c_str(), nullptr, 16)));
  } else if (cmd == "width") {
    float w = 0;
    if (!(in >> w)) return false;
    ctx.SetStrokeWidth(w);
  } else if (cmd == "rect") {
    int x, y, w, h;
    if (!(in >> x >> y >> w >> h)) return false;
    std::printf("rect id=%d\n", ctx.AddRect(x, y, w, h));
  } else if (cmd == "arrow") {
    int x1, y1, x2, y2;
    if (!(in >> x1 >> y1 >> x2 >> y2)) return false;
    std::printf("arrow id=%d\n", ctx.AddArrow(x1, y1, x2, y2));
  } else if (cmd == "stroke") {
    std::vector<int> pts;
    int v;
    while (in >> v) pts.push_back(v);
    if (pts.size() < 4) return false;
    std::printf("stroke id=%d\n", ctx.AddStroke(pts));
  } else if (cmd == "text") {
    int x, y;
    if (!(in >> x >> y)) return false;
    std::string text;
    std::getline(in, text);
    if (!text.empty() && text[0] == ' ') text.erase(0, 1);
    if (text.empty()) return false;
    std::printf("text id=%d\n", ctx.AddText(x, y, text));
  } else if (cmd == "move") {
    int id, dx, dy;
    if (!(in >> id >> dx >> dy)) return false;
    ctx.MoveObject(id, dx, dy);
  } else if (cmd == "remove") {
    int id;
    if (!(in >> id)) return false;
    ctx.RemoveObject(id);
  } else if (cmd == "crop") {
    int x, y, w, h;
    if (!(in >> x >> y >> w >> h)) return false;
    ctx.Crop(x, y, w, h);
  } else if (cmd == "mosaic") {
    int x, y, w, h;
    if (!(in >> x >> y >> w >> h)) return false;
    std::printf("mosaic id=%d\n", ctx.Mosaic(x, y, w, h));
  } else if (cmd == "flush") {
    ctx.FlushHistory();
  } else if (cmd == "undo") {
    std::printf("undo %s\n", ctx.Undo() ? "ok" : "ignored");
  } else if (cmd == "redo") {
    std::printf("redo %s\n", ctx.Redo() ? "ok" : "ignored");
  } else if (cmd == "wait") {
    int ms = 0;
    if (!(in >> ms)) return false;
    Pump(ctx, ms);
  } else if (cmd == "info") {
    PrintInfo(ctx);
  } else {
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  std::printf("skitch_cli %s\n", skitch::version_string());

  std::ifstream file;
  std::istream* script = &std::cin;
  if (argc > 1 && std::strcmp(argv[1], "-") != 0) {
    file.open(argv[1]);
    if (!file) {
      std::fprintf(stderr, "cannot open script %s\n", argv[1]);
      return 1;
    }
    script = &file;
  }

  try {
    skitch::Context ctx;
    std::string line;
    int line_no = 0;
    int failures = 0;
    while (std::getline(*script, line)) {
      ++line_no;
      try {
        if (!RunCommand(ctx, line)) {
          std::fprintf(stderr, "line %d: bad command: %s\n", line_no,
                       line.c_str());
          ++failures;
        }
      } catch (const skitch::Error& e) {
        std::fprintf(stderr, "line %d: %s (error %d)\n", line_no, e.what(),
                     static_cast<int>(e.code()));
        ++failures;
      }
    }
    ctx.SyncHistory();
    PrintInfo(ctx);
    return failures == 0 ? 0 : 2;
  } catch (const skitch::Error& e) {
    std::fprintf(stderr, "skitch: %s\n", e.what());
    return 1;
  }
}
