#include <catch2/catch_test_macros.hpp>

#include "archive/archive_reader.hpp"
#include "archive/archive_writer.hpp"
#include "archive/compression.hpp"
#include "core/utf8_path.hpp"
#include "helpers/test_utils.hpp"

#include <filesystem>
#include <string>
#include <vector>

using namespace rscpack::archive;
using rscpack::core::ErrorKind;
using test_helpers::TempDir;
using test_helpers::read_file;
using test_helpers::write_file;

namespace fs = std::filesystem;

namespace {

// Packs app.exe (5000 B) + data.txt (120 B) into dir/packed.
PackReport pack_scenario(const TempDir& dir, bool compress) {
    write_file(dir / "app.exe", test_helpers::pattern_bytes(5000));
    write_file(dir / "data.txt", test_helpers::pattern_bytes(120, 9));

    BuildRequest req;
    req.resources = {dir / "app.exe", dir / "data.txt"};
    req.mainFile = "app.exe";
    req.extractionPath = "rc_extracted";
    req.compress = compress;
    req.stubBytes = test_helpers::fake_stub(1000);
    req.outputPath = dir / "packed";

    PackReport report;
    const auto st = pack(req, &report);
    REQUIRE(st);
    return report;
}

void check_round_trip(bool compress) {
    TempDir dir;
    const PackReport report = pack_scenario(dir, compress);

    ArchiveReader reader;
    REQUIRE(reader.open(dir / "packed"));
    REQUIRE(reader.is_open());
    REQUIRE(reader.header().isCompressed == compress);
    REQUIRE(reader.header().mainFile == "app.exe");
    REQUIRE(reader.archive_start() == 1000);
    REQUIRE(reader.footer().headerLength == report.footer.headerLength);
    REQUIRE(reader.footer().archiveDataLength == report.footer.archiveDataLength);

    std::vector<std::uint8_t> payload;
    REQUIRE(reader.read_payload(&payload));
    REQUIRE(payload.size() == reader.header().total_resource_size());

    const fs::path out = dir / "out";
    std::vector<fs::path> written;
    REQUIRE(reader.extract_all(out, &written));

    REQUIRE(written.size() == 2);
    REQUIRE(written[0] == out / "app.exe");
    REQUIRE(written[1] == out / "data.txt");
    REQUIRE(read_file(out / "app.exe") == read_file(dir / "app.exe"));
    REQUIRE(read_file(out / "data.txt") == read_file(dir / "data.txt"));
}

} // namespace

// =============================================================================
// Round trip
// =============================================================================

TEST_CASE("Extracted files match the packed resources", "[archive][reader]") {
    SECTION("raw payload") {
        check_round_trip(false);
    }

    SECTION("compressed payload") {
        check_round_trip(true);
    }
}

TEST_CASE("Extraction into an existing directory overwrites files", "[archive][reader]") {
    TempDir dir;
    pack_scenario(dir, false);

    const fs::path out = dir / "out";
    write_file(out / "app.exe", std::string("stale"));

    ArchiveReader reader;
    REQUIRE(reader.open(dir / "packed"));
    REQUIRE(reader.extract_all(out, nullptr));
    REQUIRE(read_file(out / "app.exe") == test_helpers::pattern_bytes(5000));
}

TEST_CASE("Nested extraction directories are created", "[archive][reader]") {
    TempDir dir;
    pack_scenario(dir, true);

    const fs::path out = dir / "a" / "b" / "c";
    ArchiveReader reader;
    REQUIRE(reader.open(dir / "packed"));
    REQUIRE(reader.extract_all(out, nullptr));
    REQUIRE(fs::exists(out / "data.txt"));
}

// =============================================================================
// Damage detection
// =============================================================================

TEST_CASE("Files without an archive are rejected", "[archive][reader]") {
    TempDir dir;

    SECTION("shorter than a footer") {
        write_file(dir / "tiny", std::string("MZ"));
        ArchiveReader reader;
        REQUIRE(reader.open(dir / "tiny").kind == ErrorKind::CorruptArchive);
        REQUIRE_FALSE(reader.is_open());
    }

    SECTION("plain executable without marker") {
        write_file(dir / "plain", test_helpers::fake_stub(4096));
        ArchiveReader reader;
        REQUIRE(reader.open(dir / "plain").kind == ErrorKind::CorruptArchive);
    }

    SECTION("missing file") {
        ArchiveReader reader;
        REQUIRE(reader.open(dir / "nope").kind == ErrorKind::IO);
    }
}

TEST_CASE("Truncated bundles fail without writing files", "[archive][reader]") {
    // 0 stands for "all but the first 10 bytes".
    for (bool compress : {false, true}) {
        for (std::uintmax_t cut : {1u, 2u, 8u, 23u, 24u, 25u, 100u, 0u}) {
            TempDir dir;
            pack_scenario(dir, compress);
            if (cut == 0) {
                cut = fs::file_size(dir / "packed") - 10;
            }
            test_helpers::truncate_file(dir / "packed", cut);

            ArchiveReader reader;
            const auto st = reader.open(dir / "packed");
            REQUIRE(st.kind == ErrorKind::CorruptArchive);
            REQUIRE_FALSE(reader.is_open());
            REQUIRE_FALSE(fs::exists(dir / "out"));
        }
    }
}

TEST_CASE("Tampered footer marker is detected", "[archive][reader]") {
    TempDir dir;
    pack_scenario(dir, false);
    const auto original = read_file(dir / "packed");
    REQUIRE(original.size() > FOOTER_MARKER_SIZE);

    // The marker is the last 16 bytes of the file.
    for (std::size_t i = original.size() - FOOTER_MARKER_SIZE; i < original.size(); ++i) {
        auto bytes = original;
        bytes[i] ^= 0xFF;
        write_file(dir / "packed", bytes);

        ArchiveReader reader;
        REQUIRE(reader.open(dir / "packed").kind == ErrorKind::CorruptArchive);
        REQUIRE_FALSE(reader.is_open());
    }
}

TEST_CASE("Entry sizes past the payload end are an overrun", "[archive][reader]") {
    TempDir dir;

    ArchiveHeader header;
    header.extractionPath = "out";
    header.mainFile = "a.bin";
    header.resources = {{"a.bin", 10}, {"b.bin", 100}};

    std::vector<std::uint8_t> archiveData;
    REQUIRE(encode_header(header, &archiveData));
    const auto headerLength = static_cast<std::uint32_t>(archiveData.size());

    const auto payload = test_helpers::pattern_bytes(50);
    archiveData.insert(archiveData.end(), payload.begin(), payload.end());

    Footer footer;
    footer.headerLength = headerLength;
    footer.archiveDataLength = static_cast<std::uint32_t>(archiveData.size());
    REQUIRE(write_self_extractor(dir / "bad", test_helpers::fake_stub(), archiveData, footer));

    ArchiveReader reader;
    REQUIRE(reader.open(dir / "bad"));

    std::vector<fs::path> written;
    const auto st = reader.extract_all(dir / "out", &written);
    REQUIRE(st.kind == ErrorKind::CorruptArchive);

    // Entries before the overrun stay on disk.
    REQUIRE(written.size() == 1);
    REQUIRE(fs::file_size(dir / "out" / "a.bin") == 10);
    REQUIRE_FALSE(fs::exists(dir / "out" / "b.bin"));
}

TEST_CASE("Declared sizes larger than the inflated payload are an overrun", "[archive][reader]") {
    TempDir dir;

    ArchiveHeader header;
    header.extractionPath = "out";
    header.mainFile = "a.bin";
    header.resources = {{"a.bin", 0xFFFFFFF0u}};
    header.isCompressed = true;

    std::vector<std::uint8_t> archiveData;
    REQUIRE(encode_header(header, &archiveData));
    const auto headerLength = static_cast<std::uint32_t>(archiveData.size());

    std::vector<std::uint8_t> packed;
    REQUIRE(compress_payload(test_helpers::pattern_bytes(100), &packed));
    archiveData.insert(archiveData.end(), packed.begin(), packed.end());

    Footer footer;
    footer.headerLength = headerLength;
    footer.archiveDataLength = static_cast<std::uint32_t>(archiveData.size());
    REQUIRE(write_self_extractor(dir / "bad", test_helpers::fake_stub(), archiveData, footer));

    ArchiveReader reader;
    REQUIRE(reader.open(dir / "bad"));

    std::vector<std::uint8_t> payload;
    REQUIRE(reader.read_payload(&payload));
    REQUIRE(payload.size() == 100);

    REQUIRE(reader.extract_all(dir / "out", nullptr).kind == ErrorKind::CorruptArchive);
    REQUIRE_FALSE(fs::exists(dir / "out" / "a.bin"));
}

TEST_CASE("Corrupted compressed payload is detected", "[archive][reader]") {
    TempDir dir;
    const PackReport report = pack_scenario(dir, true);

    auto bytes = read_file(dir / "packed");
    // Damage the middle of the gzip stream.
    const std::size_t payloadStart = 1000 + report.footer.headerLength;
    const std::size_t payloadSize = report.footer.archiveDataLength - report.footer.headerLength;
    for (std::size_t i = payloadStart + 10; i < payloadStart + payloadSize - 8; ++i) {
        bytes[i] = 0xFF;
    }
    write_file(dir / "packed", bytes);

    ArchiveReader reader;
    REQUIRE(reader.open(dir / "packed"));
    REQUIRE(reader.extract_all(dir / "out", nullptr).kind == ErrorKind::CorruptArchive);
    REQUIRE_FALSE(fs::exists(dir / "out"));
}

// =============================================================================
// Extraction targets
// =============================================================================

TEST_CASE("An empty extraction directory means the working directory", "[archive][reader]") {
    TempDir dir;
    pack_scenario(dir, false);

    const fs::path cwd = dir / "cwd";
    fs::create_directories(cwd);

    ArchiveReader reader;
    REQUIRE(reader.open(dir / "packed"));

    std::vector<fs::path> written;
    {
        test_helpers::CurrentDirGuard guard(cwd);
        REQUIRE(reader.extract_all(fs::path(), &written));
    }

    REQUIRE(written.size() == 2);
    REQUIRE(read_file(cwd / "app.exe") == test_helpers::pattern_bytes(5000));
    REQUIRE(read_file(cwd / "data.txt") == test_helpers::pattern_bytes(120, 9));
}

TEST_CASE("Non-ASCII resource names survive packing and extraction", "[archive][reader]") {
    using rscpack::core::path_from_utf8;
    using rscpack::core::path_to_utf8;

    // "données-ünï.txt" in UTF-8.
    const std::string name = "donn\xC3\xA9" "es-\xC3\xBC" "n\xC3\xAF.txt";
    REQUIRE(path_to_utf8(path_from_utf8(name)) == name);

    TempDir dir;
    write_file(dir.path() / path_from_utf8(name), test_helpers::pattern_bytes(64, 4));

    BuildRequest req;
    req.resources = {dir.path() / path_from_utf8(name)};
    req.mainFile = name;
    req.extractionPath = "out";
    req.stubBytes = test_helpers::fake_stub();
    req.outputPath = dir / "packed";
    REQUIRE(pack(req, nullptr));

    ArchiveReader reader;
    REQUIRE(reader.open(dir / "packed"));
    REQUIRE(reader.header().resources.size() == 1);
    REQUIRE(reader.header().resources[0].filename == name);

    const fs::path out = dir / "out";
    REQUIRE(reader.extract_all(out, nullptr));
    REQUIRE(read_file(out / path_from_utf8(name)) == test_helpers::pattern_bytes(64, 4));
}
