// DSF header parsing: accepted fixtures, every rejection kind and file-backed sources.
#include <iostream>
#include <string>
#include <vector>

#include "dsdslicer.hpp"
#include "dsf_reader.hpp"
#include "dsf_test_utils.hpp"

using dsdslicer::ErrorKind;
using dsdslicer::MemoryByteSource;
using dsdslicer::SplitStatus;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[dsf_reader_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

// Source whose reads always fail, to exercise IOReadError.
class FailingSource : public dsdslicer::ByteSource {
   public:
    uint64_t size() const override { return 4096; }
    bool read_at(uint64_t, uint8_t *, size_t) const override { return false; }
};

test_utils::FixtureLayout stereo_fixture() {
    test_utils::FixtureLayout fx;
    fx.sample_count = 1000;  // 125 bytes per channel, 8 blocks of 16
    return fx;
}

bool test_valid() {
    auto fx = stereo_fixture();
    fx.tag = {'I', 'D', '3', 4, 0, 0, 0, 0, 0, 0};
    MemoryByteSource src(test_utils::make_pattern_dsf(fx));
    SplitStatus status;
    auto d = parse_dsf(src, status);
    bool ok = check(d.has_value() && status.ok, "valid fixture parses");
    if (!d) {
        return false;
    }
    ok &= check(d->channel_count == 2 && d->channel_type == 2, "channels");
    ok &= check(d->sampling_frequency == 7500, "sampling frequency");
    ok &= check(d->bits_per_sample == 1, "bits per sample");
    ok &= check(d->sample_count == 1000, "sample count");
    ok &= check(d->block_size_per_channel == 16, "block size");
    ok &= check(d->data_offset == 92, "data region offset");
    ok &= check(d->data_size == 8 * 16 * 2, "data region size");
    ok &= check(d->block_count() == 8, "block count");
    ok &= check(d->metadata_offset == 92 + 256 && d->metadata_size == 10, "metadata region");
    auto tag = read_dsf_metadata(*d);
    ok &= check(tag.size() == 10 && tag[0] == 'I', "metadata bytes");

    uint8_t b = 0;
    ok &= check(d->read_data(16, &b, 1) && b == test_utils::pattern_byte(1, 0),
                "block 0 of channel 1 follows channel 0");
    ok &= check(!d->read_data(256, &b, 1), "read_data refuses bytes past the data region");
    return ok;
}

bool expect_reject(std::vector<uint8_t> bytes, ErrorKind kind, const std::string &what) {
    MemoryByteSource src(std::move(bytes));
    SplitStatus status;
    auto d = parse_dsf(src, status);
    return check(!d && status.kind == kind,
                 what + ": got " + std::string(error_kind_name(status.kind)));
}

bool test_rejections() {
    const auto good = test_utils::make_pattern_dsf(stereo_fixture());
    bool ok = true;

    auto bad_magic = good;
    bad_magic[0] = 'R';
    ok &= expect_reject(bad_magic, ErrorKind::NotAValidContainer, "bad magic");

    ok &= expect_reject(std::vector<uint8_t>(good.begin(), good.begin() + 60),
                        ErrorKind::NotAValidContainer, "truncated header");

    auto bad_fmt = good;
    bad_fmt[28] = 'x';
    ok &= expect_reject(bad_fmt, ErrorKind::NotAValidContainer, "missing fmt chunk");

    auto bad_fmt_size = good;
    bad_fmt_size[32] = 60;
    ok &= expect_reject(bad_fmt_size, ErrorKind::NotAValidContainer, "fmt size");

    auto dst = stereo_fixture();
    dst.format_id = 1;
    ok &= expect_reject(test_utils::make_pattern_dsf(dst), ErrorKind::UnsupportedFormat,
                        "DST format id");

    auto eight_bit = stereo_fixture();
    eight_bit.bits_per_sample = 8;
    ok &= expect_reject(test_utils::make_pattern_dsf(eight_bit), ErrorKind::UnsupportedBitDepth,
                        "8 bits per sample");

    auto no_channels = good;
    no_channels[52] = 0;
    ok &= expect_reject(no_channels, ErrorKind::NotAValidContainer, "zero channels");

    auto no_block = good;
    no_block[72] = 0;
    ok &= expect_reject(no_block, ErrorKind::NotAValidContainer, "zero block size");

    auto no_data = good;
    no_data[80] = 'D';
    ok &= expect_reject(no_data, ErrorKind::NotAValidContainer, "missing data chunk");

    auto short_data = good;
    short_data.resize(short_data.size() - 1);
    ok &= expect_reject(short_data, ErrorKind::NotAValidContainer, "data past the end");

    auto meta_inside = good;
    meta_inside[20] = 100;
    ok &= expect_reject(meta_inside, ErrorKind::NotAValidContainer,
                        "metadata offset inside the data region");

    FailingSource failing;
    SplitStatus status;
    ok &= check(!parse_dsf(failing, status) && status.kind == ErrorKind::IOReadError,
                "failing reads are IOReadError");
    return ok;
}

bool test_version_tolerated() {
    auto bytes = test_utils::make_pattern_dsf(stereo_fixture());
    bytes[40] = 2;  // format version
    MemoryByteSource src(bytes);
    SplitStatus status;
    auto d = parse_dsf(src, status);
    return check(d && d->format_version == 2, "other format versions parse with a warning");
}

bool test_file_source(const std::string &out_root) {
    auto dir = test_utils::scratch_dir(out_root, "dsf_reader_unit");
    const auto path = dir / "fixture.dsf";
    bool ok = check(test_utils::write_file(path, test_utils::make_pattern_dsf(stereo_fixture())),
                    "fixture written");

    auto src = dsdslicer::FileByteSource::open(path.string());
    ok &= check(src != nullptr, "file source opens");
    if (src) {
        SplitStatus status;
        auto d = parse_dsf(*src, status);
        ok &= check(d && d->sample_count == 1000, "file source parses");
        uint8_t b = 0;
        ok &= check(d && d->read_data(32, &b, 1) && b == test_utils::pattern_byte(0, 16),
                    "file source reads the second block");
    }
    ok &= check(dsdslicer::FileByteSource::open((dir / "missing.dsf").string()) == nullptr,
                "missing file yields no source");

    SplitStatus status;
    auto d = dsdslicer::inspect_dsf(path.string(), status);
    ok &= check(d && d->source == nullptr && d->channel_count == 2,
                "inspect_dsf returns a detached descriptor");
    SplitStatus missing;
    ok &= check(!dsdslicer::inspect_dsf((dir / "missing.dsf").string(), missing) &&
                    missing.kind == ErrorKind::IOReadError,
                "inspect_dsf on a missing file");
    return ok;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc != 2) {
        std::cerr << "usage: dsf_reader_unit <OUTPUT_DIR>\n";
        return 2;
    }
    bool ok = true;
    ok &= test_valid();
    ok &= test_rejections();
    ok &= test_version_tolerated();
    ok &= test_file_source(argv[1]);
    return ok ? 0 : 1;
}
