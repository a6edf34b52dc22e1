#include "test_util.hpp"
#include "compress_fixture.hpp"
#include "io/byte_source.hpp"
#include "io/compression.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

using namespace fastxio;
using namespace compress_fixture;

static std::string g_test_dir;

// Delivers at most one byte per read, like a slow pipe.
class TrickleSource : public ByteSource {
public:
    explicit TrickleSource(std::string data) : data_(std::move(data)) {}

    ssize_t read(uint8_t* buf, size_t n) override {
        if (n == 0 || pos_ >= data_.size()) return 0;
        buf[0] = static_cast<uint8_t>(data_[pos_++]);
        return 1;
    }

private:
    std::string data_;
    size_t pos_ = 0;
};

class BrokenSource : public ByteSource {
public:
    ssize_t read(uint8_t*, size_t) override { return fail("simulated read failure"); }
};

// Drain a source completely; returns false on read failure.
static bool drain(ByteSource& src, std::string& out, std::string& err) {
    out.clear();
    uint8_t buf[4096];
    while (true) {
        ssize_t r = src.read(buf, sizeof(buf));
        if (r < 0) {
            err = src.error();
            return false;
        }
        if (r == 0) return true;
        out.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(r));
    }
}

static std::string decode(std::unique_ptr<ByteSource> src, Compression* detected = nullptr) {
    std::string err;
    auto dec = open_decompressed(std::move(src), err, detected);
    if (!dec) return "<open failed: " + err + ">";
    std::string out;
    if (!drain(*dec, out, err)) return "<read failed: " + err + ">";
    return out;
}

static void test_detect_magic() {
    std::fprintf(stderr, "-- test_detect_magic\n");

    const uint8_t gz[] = {0x1F, 0x8B, 0x08};
    const uint8_t bz[] = {'B', 'Z', 'h'};
    const uint8_t fa[] = {'>', 's', '1'};
    const uint8_t bz_short[] = {'B', 'Z'};
    CHECK(detect_compression(gz, 2) == Compression::kGzip);
    CHECK(detect_compression(gz, 3) == Compression::kGzip);
    CHECK(detect_compression(bz, 3) == Compression::kBzip2);
    CHECK(detect_compression(bz_short, 2) == Compression::kNone);
    CHECK(detect_compression(fa, 3) == Compression::kNone);
    CHECK(detect_compression(gz, 1) == Compression::kNone);
    CHECK(detect_compression(nullptr, 0) == Compression::kNone);
    CHECK_STR(compression_name(Compression::kBzip2), "bzip2");
}

static void test_plain_passthrough() {
    std::fprintf(stderr, "-- test_plain_passthrough\n");

    Compression c = Compression::kGzip;
    std::string text = ">seq1\nACGT\n";
    CHECK_STR(decode(std::make_unique<MemorySource>(text), &c), text);
    CHECK(c == Compression::kNone);

    // Inputs shorter than the magic prefix are kept intact
    CHECK_STR(decode(std::make_unique<MemorySource>("A")), "A");
    CHECK_STR(decode(std::make_unique<MemorySource>("")), "");
    // Looks like the start of a bzip2 header but is not one
    CHECK_STR(decode(std::make_unique<MemorySource>("BZ")), "BZ");
}

static void test_gzip() {
    std::fprintf(stderr, "-- test_gzip\n");

    std::string text = ">seq1 compressed\nATCG\n>seq2 compressed\nGGCC\n";
    Compression c = Compression::kNone;
    CHECK_STR(decode(std::make_unique<MemorySource>(gzip_bytes(text)), &c), text);
    CHECK(c == Compression::kGzip);
}

static void test_bzip2() {
    std::fprintf(stderr, "-- test_bzip2\n");

    std::string text = ">seq1 bz2\nATCG\n>seq2 bz2\nGGCC\n";
    Compression c = Compression::kNone;
    CHECK_STR(decode(std::make_unique<MemorySource>(bzip2_bytes(text)), &c), text);
    CHECK(c == Compression::kBzip2);
}

static void test_concatenated_members() {
    std::fprintf(stderr, "-- test_concatenated_members\n");

    std::string a = "@r1\nACGT\n+\nIIII\n";
    std::string b = "@r2\nGG\n+\nJJ\n";
    CHECK_STR(decode(std::make_unique<MemorySource>(gzip_bytes(a) + gzip_bytes(b))), a + b);
    CHECK_STR(decode(std::make_unique<MemorySource>(bzip2_bytes(a) + bzip2_bytes(b))), a + b);
}

static void test_large_payload() {
    std::fprintf(stderr, "-- test_large_payload\n");

    // Spans several decoder input and output chunks
    std::string text;
    for (int i = 0; i < 20000; i++) {
        text += ">seq" + std::to_string(i) + "\n";
        text += std::string(40, "ACGT"[i % 4]) + "\n";
    }
    CHECK(decode(std::make_unique<MemorySource>(gzip_bytes(text))) == text);
    CHECK(decode(std::make_unique<MemorySource>(bzip2_bytes(text))) == text);
}

static void test_short_reads() {
    std::fprintf(stderr, "-- test_short_reads\n");

    std::string text = ">s\nACGTACGT\n";
    Compression c = Compression::kNone;
    CHECK_STR(decode(std::make_unique<TrickleSource>(gzip_bytes(text)), &c), text);
    CHECK(c == Compression::kGzip);
    CHECK_STR(decode(std::make_unique<TrickleSource>(bzip2_bytes(text)), &c), text);
    CHECK(c == Compression::kBzip2);
    CHECK_STR(decode(std::make_unique<TrickleSource>(text), &c), text);
    CHECK(c == Compression::kNone);
}

static void test_truncated_gzip() {
    std::fprintf(stderr, "-- test_truncated_gzip\n");

    std::string gz = gzip_bytes(std::string(5000, 'A'));
    gz.resize(gz.size() / 2);
    std::string out = decode(std::make_unique<MemorySource>(gz));
    CHECK(contains(out, "<read failed"));
    CHECK(contains(out, "gzip"));
}

static void test_truncated_bzip2() {
    std::fprintf(stderr, "-- test_truncated_bzip2\n");

    std::string bz = bzip2_bytes(std::string(5000, 'A'));
    bz.resize(bz.size() - 4);
    std::string out = decode(std::make_unique<MemorySource>(bz));
    CHECK(contains(out, "<read failed"));
    CHECK(contains(out, "bzip2"));
}

static void test_gzip_trailing_padding() {
    std::fprintf(stderr, "-- test_gzip_trailing_padding\n");

    std::string a = ">r1\nACGT\n";
    std::string b = ">r2\nGG\n";
    std::string pad(4, '\0');
    CHECK_STR(decode(std::make_unique<MemorySource>(gzip_bytes(a) + pad)), a);
    CHECK_STR(decode(std::make_unique<MemorySource>(gzip_bytes(a) + std::string(1, '\0'))), a);
    CHECK_STR(decode(std::make_unique<MemorySource>(gzip_bytes(a) + gzip_bytes(b) + pad)),
              a + b);
    // Member boundary seen one byte at a time
    CHECK_STR(decode(std::make_unique<TrickleSource>(gzip_bytes(a) + gzip_bytes(b) + pad)),
              a + b);

    // A second member that is cut short is still an error
    std::string cut = gzip_bytes(b);
    cut.resize(cut.size() / 2);
    CHECK(contains(decode(std::make_unique<MemorySource>(gzip_bytes(a) + cut)),
                   "<read failed"));
}

static void test_unreadable_stream() {
    std::fprintf(stderr, "-- test_unreadable_stream\n");

    std::ifstream never_opened(g_test_dir + "/no_such_dir/x.fa");
    CHECK(!never_opened.is_open());
    std::string err;
    auto dec = open_decompressed(std::make_unique<IstreamSource>(never_opened), err);
    CHECK(dec == nullptr);
    CHECK(contains(err, "not readable"));

    // Reading to the end of a good stream is a clean end, not a failure
    std::istringstream in("ABC");
    IstreamSource src(in);
    uint8_t buf[8];
    CHECK_EQ(src.read(buf, 3), 3);
    CHECK_EQ(src.read(buf, sizeof(buf)), 0);
    CHECK_EQ(src.read(buf, sizeof(buf)), 0);
    CHECK(src.error().empty());
}

static void test_open_failure_propagates() {
    std::fprintf(stderr, "-- test_open_failure_propagates\n");

    std::string err;
    auto dec = open_decompressed(std::make_unique<BrokenSource>(), err);
    CHECK(dec == nullptr);
    CHECK(contains(err, "simulated read failure"));
}

static void test_file_and_stream_sources() {
    std::fprintf(stderr, "-- test_file_and_stream_sources\n");

    std::string text = ">f\nAC\n";
    std::string path = g_test_dir + "/plain.fa.gz";
    write_file(path, gzip_bytes(text));

    std::string err;
    auto fd_src = FdSource::open(path, err);
    CHECK(fd_src != nullptr);
    if (fd_src) CHECK_STR(decode(std::move(fd_src)), text);

    auto missing = FdSource::open(g_test_dir + "/missing.fa", err);
    CHECK(missing == nullptr);
    CHECK(contains(err, "cannot open"));

    std::istringstream in(bzip2_bytes(text));
    CHECK_STR(decode(std::make_unique<IstreamSource>(in)), text);
}

int main() {
    g_test_dir = "/tmp/fastxio_compression_test";
    std::filesystem::create_directories(g_test_dir);

    test_detect_magic();
    test_plain_passthrough();
    test_gzip();
    test_bzip2();
    test_concatenated_members();
    test_large_payload();
    test_short_reads();
    test_truncated_gzip();
    test_truncated_bzip2();
    test_gzip_trailing_padding();
    test_unreadable_stream();
    test_open_failure_propagates();
    test_file_and_stream_sources();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
