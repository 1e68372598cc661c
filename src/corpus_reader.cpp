#include "bytepair/corpus_reader.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <lzma.h>
#include <nlohmann/json.hpp>
#include <zlib.h>

namespace bytepair {

namespace {
enum class FileKind { kPlain, kGzip, kXz, kJsonl, kJsonlGzip, kJsonlXz };

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

FileKind DetectKind(const std::string& path) {
  if (EndsWith(path, ".jsonl.gz") || EndsWith(path, ".ndjson.gz")) return FileKind::kJsonlGzip;
  if (EndsWith(path, ".jsonl.xz") || EndsWith(path, ".ndjson.xz")) return FileKind::kJsonlXz;
  if (EndsWith(path, ".jsonl") || EndsWith(path, ".ndjson")) return FileKind::kJsonl;
  if (EndsWith(path, ".gz")) return FileKind::kGzip;
  if (EndsWith(path, ".xz")) return FileKind::kXz;
  return FileKind::kPlain;
}

struct GzCloser {
  void operator()(gzFile_s* f) const noexcept { gzclose(f); }
};

struct LzmaGuard {
  lzma_stream strm = LZMA_STREAM_INIT;
  ~LzmaGuard() { lzma_end(&strm); }
};
}  // namespace

CorpusReader::CorpusReader(CorpusReadOptions options) : options_(std::move(options)) {}

void CorpusReader::ForEachRecord(const std::string& path, const std::function<void(const std::string&)>& fn) const {
  const FileKind kind = DetectKind(path);
  std::string payload;
  bool ok = false;
  switch (kind) {
    case FileKind::kPlain:
    case FileKind::kJsonl:
      ok = read_plain(path, payload);
      break;
    case FileKind::kGzip:
    case FileKind::kJsonlGzip:
      ok = read_gz(path, payload);
      break;
    case FileKind::kXz:
    case FileKind::kJsonlXz:
      ok = read_xz(path, payload);
      break;
  }
  if (!ok) {
    throw std::runtime_error("unable to read corpus file: " + path);
  }

  if (kind == FileKind::kJsonl || kind == FileKind::kJsonlGzip || kind == FileKind::kJsonlXz) {
    for_each_json_line(payload, fn);
  } else {
    fn(payload);
  }
}

std::string CorpusReader::ReadCorpus(const std::vector<std::string>& paths) const {
  std::string corpus;
  for (const auto& path : paths) {
    ForEachRecord(path, [&](const std::string& record) {
      if (!corpus.empty() && corpus.back() != '\n') {
        corpus.push_back('\n');
      }
      corpus += record;
    });
  }
  return corpus;
}

bool CorpusReader::read_plain(const std::string& path, std::string& out) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

bool CorpusReader::read_gz(const std::string& path, std::string& out) const {
  std::unique_ptr<gzFile_s, GzCloser> gz(gzopen(path.c_str(), "rb"));
  if (!gz) return false;
  char buf[1 << 15];
  int read_n = 0;
  while ((read_n = gzread(gz.get(), buf, sizeof(buf))) > 0) {
    out.append(buf, static_cast<std::size_t>(read_n));
  }
  return read_n == 0;
}

bool CorpusReader::read_xz(const std::string& path, std::string& out) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;

  LzmaGuard guard;
  lzma_stream& strm = guard.strm;
  if (lzma_stream_decoder(&strm, UINT64_MAX, 0) != LZMA_OK) {
    return false;
  }

  std::vector<std::uint8_t> in_buf(1 << 16);
  std::vector<std::uint8_t> out_buf(1 << 16);
  lzma_action action = LZMA_RUN;
  bool eof = false;
  while (true) {
    if (strm.avail_in == 0 && !eof) {
      in.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
      const std::streamsize got = in.gcount();
      strm.next_in = in_buf.data();
      strm.avail_in = static_cast<std::size_t>(got);
      if (got == 0) {
        eof = true;
        action = LZMA_FINISH;
      }
    }

    strm.next_out = out_buf.data();
    strm.avail_out = out_buf.size();
    const lzma_ret ret = lzma_code(&strm, action);
    const std::size_t produced = out_buf.size() - strm.avail_out;
    out.append(reinterpret_cast<const char*>(out_buf.data()), produced);

    if (ret == LZMA_STREAM_END) {
      return true;
    }
    if (ret != LZMA_OK) {
      return false;
    }
    if (eof && strm.avail_in == 0 && produced == 0) {
      return false;
    }
  }
}

void CorpusReader::for_each_json_line(const std::string& payload,
                                      const std::function<void(const std::string&)>& fn) const {
  std::istringstream iss(payload);
  std::string line;
  while (std::getline(iss, line)) {
    if (line.empty()) continue;
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) continue;
    auto it = j.find(options_.text_field);
    if (it != j.end() && it->is_string()) {
      fn(it->get<std::string>());
    }
  }
}

}  // namespace bytepair
