// Unit coverage for small helpers: little-endian codecs, FourCC, hex preview, status text.
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "byte_source.hpp"
#include "dsf_chunks.hpp"
#include "logging.hpp"
#include "split_status.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[helper_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_endian_helpers() {
    std::vector<uint8_t> buf;
    write_u32le(buf, 0x01020304u);
    write_u64le(buf, 0x0102030405060708ULL);
    bool ok = check(buf.size() == 12, "write_u32le + write_u64le emit 12 bytes");
    ok &= check(buf[0] == 0x04 && buf[3] == 0x01, "write_u32le is little-endian");
    ok &= check(read_u32le(buf.data()) == 0x01020304u, "read_u32le decodes");
    ok &= check(read_u64le(buf.data() + 4) == 0x0102030405060708ULL, "read_u64le decodes");

    patch_u64le(buf, 4, 42);
    ok &= check(read_u64le(buf.data() + 4) == 42, "patch_u64le overwrites in place");
    ok &= check(buf.size() == 12, "patch_u64le keeps the size");

    std::vector<uint8_t> be;
    write_u32(be, 0x01020304u);
    ok &= check(be[0] == 0x01 && be[3] == 0x04, "write_u32 is big-endian");
    return ok;
}

bool test_fourcc() {
    bool ok = check(fourcc_to_string(fourcc("DSD ")) == "DSD ", "fourcc round trip");
    const uint8_t raw[4] = {'d', 'a', 't', 'a'};
    ok &= check(fourcc(raw) == fourcc("data"), "fourcc from bytes");
    ok &= check(fourcc_to_string(0x01020304u) == "????", "non-printable ids render as '?'");
    return ok;
}

bool test_chunk() {
    auto c = Chunk::create("fmt ");
    c->payload.assign(40, 0xAA);
    c->fix_size();
    bool ok = check(c->size() == 52, "chunk size includes the 12-byte header");
    std::vector<uint8_t> out;
    c->write(out);
    ok &= check(out.size() == 52, "chunk writes header + payload");
    ok &= check(out[0] == 'f' && out[3] == ' ', "chunk id first");
    ok &= check(read_u64le(out.data() + 4) == 52, "chunk size little-endian after id");
    return ok;
}

bool test_hex_prefix() {
    using dsdslicer::hex_prefix;
    bool ok = check(hex_prefix({}) == "", "hex_prefix empty");
    std::vector<uint8_t> data = {0x00, 0x11, 0xAB, 0xCD, 0xFF};
    ok &= check(hex_prefix(data, 4) == "00 11 ab cd", "hex_prefix truncates to max_len");
    ok &= check(hex_prefix(data) == "00 11 ab cd ff", "hex_prefix default prints all up to limit");
    return ok;
}

bool test_status_describe() {
    using namespace dsdslicer;
    SplitStatus s;
    bool ok = check(s.ok && s.describe() == "ok", "default status is ok");
    ok &= check(!s.fail(ErrorKind::TrackBoundaryError, "past end"), "fail returns false");
    s.track_number = 3;
    s.byte_offset = 4096;
    ok &= check(s.describe() == "TrackBoundaryError: past end (track 3, offset 4096)",
                "describe lists context");
    auto e = make_error(ErrorKind::InvalidTrackListFormat, "bad");
    e.line_number = 7;
    ok &= check(e.describe() == "InvalidTrackListFormat: bad (line 7)", "describe with line");
    ok &= check(error_kind_name(ErrorKind::Skipped) == "Skipped", "error_kind_name");
    return ok;
}

bool test_log_levels() {
    using namespace dsdslicer;
    bool ok = check(parse_log_verbosity("debug") == LogVerbosity::Debug, "parse debug");
    ok &= check(parse_log_verbosity("warning") == LogVerbosity::Warn, "parse warning");
    ok &= check(parse_log_verbosity("bogus") == LogVerbosity::Error, "unknown maps to error");
    set_log_verbosity(LogVerbosity::Warn);
    ok &= check(ds_should_log("error") && ds_should_log("warn"), "warn level logs warnings");
    ok &= check(!ds_should_log("info") && !ds_should_log("extract"), "warn level hides debug");
    set_log_verbosity(LogVerbosity::Info);
    return ok;
}

bool test_memory_source() {
    dsdslicer::MemoryByteSource src({1, 2, 3, 4, 5});
    uint8_t buf[3] = {};
    bool ok = check(src.read_at(2, buf, 3) && buf[0] == 3 && buf[2] == 5, "in-range read");
    ok &= check(!src.read_at(3, buf, 3), "read past the end fails");
    ok &= check(src.read_at(5, buf, 0), "empty read at the end succeeds");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_endian_helpers();
    ok &= test_fourcc();
    ok &= test_chunk();
    ok &= test_hex_prefix();
    ok &= test_status_describe();
    ok &= test_log_levels();
    ok &= test_memory_source();
    return ok ? 0 : 1;
}
