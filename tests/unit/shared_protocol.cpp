#include <array>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <asio/buffer.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read_until.hpp>
#include <asio/streambuf.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include "pandrive/chunk_plan.hpp"
#include "pandrive/crypto.hpp"
#include "pandrive/encoding/base64.hpp"
#include "pandrive/encryption_header.hpp"
#include "pandrive/error_codes.hpp"
#include "pandrive/errors.hpp"
#include "pandrive/http.hpp"
#include "pandrive/protocol.hpp"
#include "pandrive/range_source.hpp"

using namespace pandrive;
using namespace pandrive::protocol;

void run_cipher_component_tests();
void run_transfer_component_tests();
void run_client_component_tests();

namespace
{

    std::span<const std::byte> bytes_of(const std::string &text)
    {
        return std::as_bytes(std::span(text.data(), text.size()));
    }

    void test_iso8601()
    {
        assert(iso8601_to_epoch("2024-05-01T10:00:00.000Z") == 1714557600);
        assert(iso8601_to_epoch("1970-01-01T00:00:00Z") == 0);
        assert(epoch_to_iso8601(1714557600) == "2024-05-01T10:00:00.000Z");

        bool caught = false;
        try
        {
            (void)iso8601_to_epoch("yesterday");
        }
        catch (const std::invalid_argument &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_create_file_request()
    {
        CreateFileRequest request{
            .drive_id = "drive-1",
            .parent_file_id = "root",
            .name = "notes.txt",
            .size = 2048,
            .part_count = 3,
            .pre_hash = "abcd",
            .local_modified_at = 1714557600,
        };

        const auto json = nlohmann::json(request);
        assert(json.at("type") == "file");
        assert(json.at("check_name_mode") == "refuse");
        assert(json.at("part_info_list").size() == 3);
        assert(json.at("part_info_list")[2].at("part_number") == 3);
        assert(json.at("pre_hash") == "abcd");
        assert(json.at("content_hash") == "");
        assert(json.at("content_hash_name") == "sha1");
        assert(json.at("proof_version") == "v1");
        assert(json.at("local_modified_at") == "2024-05-01T10:00:00.000Z");

        const auto decoded = json.get<CreateFileRequest>();
        assert(decoded.name == "notes.txt");
        assert(decoded.part_count == 3);
        assert(decoded.size == 2048);
    }

    void test_create_file_response()
    {
        const auto json = nlohmann::json::parse(R"({
            "file_id": "f-1",
            "upload_id": "u-1",
            "rapid_upload": false,
            "part_info_list": [
                {"part_number": 1, "upload_url": "https://up.example/1", "part_size": 512},
                {"part_number": 2, "upload_url": "https://up.example/2"}
            ]
        })");
        const auto response = json.get<CreateFileResponse>();
        assert(response.file_id == "f-1");
        assert(response.upload_id == "u-1");
        assert(!response.rapid_upload);
        assert(response.pre_hash.empty());
        assert(response.parts.size() == 2);
        assert(response.parts[0].part_size == std::optional<std::uint64_t>(512));
        assert(!response.parts[1].part_size);
        assert(response.parts[1].upload_url == "https://up.example/2");
    }

    void test_remote_file_and_pages()
    {
        const auto json = nlohmann::json::parse(R"({
            "items": [
                {"file_id": "a", "parent_file_id": "root", "name": "docs", "type": "folder",
                 "updated_at": "2024-05-01T10:00:00.000Z"},
                {"file_id": "b", "parent_file_id": "a", "name": "x.bin", "type": "file", "size": 12,
                 "content_hash": "ABCDEF", "updated_at": "2024-05-01T10:00:00.000Z",
                 "local_modified_at": "1970-01-01T00:00:10.000Z"}
            ],
            "next_marker": "m2"
        })");
        const auto page = json.get<FileListPage>();
        assert(page.next_marker == "m2");
        assert(page.items.size() == 2);
        assert(page.items[0].type == EntryType::Folder);
        assert(!page.items[0].content_hash);
        assert(page.items[1].size == 12);
        assert(page.items[1].content_hash == std::optional<std::string>("ABCDEF"));
        assert(page.items[1].updated_at == 1714557600);
        assert(page.items[1].local_modified_at == std::optional<std::int64_t>(10));

        const auto url = nlohmann::json::parse(R"({"url": "https://dl.example/x", "expiration": "2024-05-01T10:00:00.000Z", "size": 12})")
                             .get<DownloadUrl>();
        assert(url.url == "https://dl.example/x");
        assert(url.expires_at == std::optional<std::int64_t>(1714557600));
        assert(url.size == 12);

        const auto error = nlohmann::json::parse(R"({"code": "PreHashMatched", "message": "pre hash matched"})")
                               .get<ApiError>();
        assert(error.code == "PreHashMatched");

        assert(to_string(EntryType::Folder) == "folder");
        assert(entry_type_from_string("file") == EntryType::File);
        assert(!entry_type_from_string("link"));
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::RetriesExhausted) == "retries_exhausted");
        assert(error_code_from_int(to_int(ErrorCode::ChecksumMismatch)) == ErrorCode::ChecksumMismatch);
        assert(error_code_from_int(999) == ErrorCode::InternalError);

        const auto cause = std::make_exception_ptr(TransportError(ErrorCode::ConnectionReset, "reset"));
        const DownloadError error(ErrorCode::RetriesExhausted, "/tmp/x", "gave up", cause);
        assert(error.code() == ErrorCode::RetriesExhausted);
        assert(error.path() == "/tmp/x");
        assert(code_of(error.cause()) == ErrorCode::ConnectionReset);
        assert(describe(error.cause()) == "reset");
        assert(code_of(std::make_exception_ptr(std::runtime_error("plain"))) == ErrorCode::InternalError);
    }

    void test_crypto()
    {
        assert(crypto::sha1_bytes(bytes_of("abc")) == "a9993e364706816aba3e25717850c26c9cd0d89d");
        assert(crypto::md5_hex("abc") == "900150983cd24fb0d6963f7d28e17f72");

        crypto::Sha1 incremental;
        incremental.update(bytes_of("a"));
        incremental.update(bytes_of("bc"));
        assert(incremental.hex_digest() == "a9993e364706816aba3e25717850c26c9cd0d89d");

        std::istringstream stream("abc");
        assert(crypto::sha1_stream(stream) == "a9993e364706816aba3e25717850c26c9cd0d89d");

        const auto file_path = std::filesystem::temp_directory_path() / "pandrive_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            for (int value = 0; value < 100; ++value)
            {
                file.put(static_cast<char>(value));
            }
        }
        std::string content;
        for (int value = 0; value < 100; ++value)
        {
            content.push_back(static_cast<char>(value));
        }
        assert(crypto::sha1_file(file_path) == crypto::sha1_bytes(bytes_of(content)));
        // Shorter than the pre-hash window: the whole file is hashed.
        assert(crypto::pre_hash_file(file_path) == crypto::sha1_bytes(bytes_of(content)));
        // md5("token") starts with 94a08da1fecbb6e8, which is 56 mod 100.
        assert(crypto::proof_code(file_path, 100, "token") == "ODk6Ozw9Pj8=");
        assert(crypto::proof_code(file_path, 0, "token").empty());
        std::filesystem::remove(file_path);

        assert(crypto::random_bytes(24).size() == 24);
        assert(encoding::encode_base64(bytes_of("hello")) == "aGVsbG8=");
    }

    void test_chunk_plans()
    {
        const auto plan = make_plan(10, 35, 10);
        assert(plan.size() == 3);
        assert(plan[0].offset == 10 && plan[0].length == 10);
        assert(plan[2].offset == 30 && plan[2].length == 5);
        assert(plan[2].end() == 35);
        assert(make_plan(5, 5, 10).empty());

        bool caught = false;
        try
        {
            (void)make_plan(0, 10, 0);
        }
        catch (const std::invalid_argument &)
        {
            caught = true;
        }
        assert(caught);

        assert(adjust_part_size(100, 10) == 10);
        assert(adjust_part_size(kMaxPartCount * 10 + 1, 10) == 11);
        const auto parts = make_part_plan(25, 10);
        assert(parts.size() == 3);
        const auto empty = make_part_plan(0, 10);
        assert(empty.size() == 1 && empty[0].length == 0);
    }

    void test_encryption_header()
    {
        auto header = cipher::new_header(cipher::CipherKind::ChaCha20, 1234);
        const auto encoded = cipher::encode_header(header);
        assert(encoded.size() == cipher::kHeaderSize);
        assert(std::string(reinterpret_cast<const char *>(encoded.data()), 8) == "PDRVENC1");

        const auto parsed = cipher::parse_header(encoded);
        assert(parsed);
        assert(parsed->kind == cipher::CipherKind::ChaCha20);
        assert(parsed->plaintext_size == 1234);
        assert(parsed->salt == header.salt);
        assert(parsed->nonce == header.nonce);

        std::array<std::byte, cipher::kHeaderSize> plain{};
        assert(!cipher::parse_header(plain));
        assert(!cipher::parse_header(std::span(encoded).first(10)));

        auto bad_tag = encoded;
        bad_tag[8] = std::byte{0x7F};
        bool caught = false;
        try
        {
            (void)cipher::parse_header(bad_tag);
        }
        catch (const EncryptionHeaderError &ex)
        {
            caught = ex.code() == ErrorCode::EncryptionHeaderInvalid;
        }
        assert(caught);

        assert(cipher::encrypted_object_size(cipher::CipherKind::None, 100) == 100);
        assert(cipher::encrypted_object_size(cipher::CipherKind::ChaCha20, 100) == 164);
        assert(cipher::encrypted_object_size(cipher::CipherKind::Aes256Cbc, 100) == 64 + 112);
        assert(cipher::encrypted_object_size(cipher::CipherKind::Aes256Cbc, 96) == 64 + 112);

        cipher::validate_object_size(header, 64 + 1234);
        caught = false;
        try
        {
            cipher::validate_object_size(header, 64 + 1000);
        }
        catch (const EncryptionHeaderError &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_http_helpers()
    {
        const auto url = http::parse_url("https://dl.example.com/file?sig=1");
        assert(url.scheme == "https");
        assert(url.host == "dl.example.com");
        assert(url.port == 443);
        assert(url.target == "/file?sig=1");

        const auto plain = http::parse_url("http://127.0.0.1:8080");
        assert(plain.port == 8080);
        assert(plain.target == "/");

        bool caught = false;
        try
        {
            (void)http::parse_url("ftp://example.com/x");
        }
        catch (const std::invalid_argument &)
        {
            caught = true;
        }
        assert(caught);

        assert(http::range_header(0, 1) == "bytes=0-0");
        assert(http::range_header(100, 50) == "bytes=100-149");

        http::Response response{.status = 206, .headers = {{"Content-Range", "bytes 0-9/10"}}, .body = ""};
        assert(response.ok());
        assert(response.header("content-range") == std::optional<std::string>("bytes 0-9/10"));
        assert(!response.header("etag"));
    }

    // A server that ignores the Range header and starts sending a large
    // object; the ranged request must return after the head.
    void test_ranged_request_ignored_by_server()
    {
        asio::io_context io;
        asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        const auto port = acceptor.local_endpoint().port();

        std::thread server([&]()
                           {
            std::error_code ec;
            asio::ip::tcp::socket socket(io);
            acceptor.accept(socket, ec);
            if (ec)
            {
                return;
            }
            asio::streambuf incoming;
            asio::read_until(socket, incoming, "\r\n\r\n", ec);
            const std::string reply = "HTTP/1.1 200 OK\r\nContent-Length: 1000000\r\n\r\n0123456789";
            asio::write(socket, asio::buffer(reply), ec);
            // Hold the connection until the client drops it.
            std::array<char, 256> scratch{};
            while (!ec)
            {
                socket.read_some(asio::buffer(scratch), ec);
            } });

        http::AsioHttpTransport transport(http::Timeouts{.connect = std::chrono::milliseconds(2000),
                                                         .idle = std::chrono::milliseconds(2000)});
        http::Request request;
        request.url = "http://127.0.0.1:" + std::to_string(port) + "/object";
        request.headers.emplace_back("Range", http::range_header(0, 10));
        request.require_partial = true;

        bool delivered = false;
        const auto response = transport.stream(request, [&](std::span<const std::byte>)
                                               { delivered = true; });
        server.join();
        assert(response.status == 200);
        assert(!delivered);
        assert(response.body.empty());
    }

    void test_range_sources()
    {
        const std::string text = "0123456789";
        MemoryRangeSource memory(bytes_of(text));
        OffsetRangeSource shifted(memory, 4);
        assert(shifted.size() == 6);
        const auto slice = shifted.read_range(1, 3);
        assert(std::string(reinterpret_cast<const char *>(slice.data()), slice.size()) == "567");
    }

} // namespace

int main()
{
    try
    {
        test_iso8601();
        test_create_file_request();
        test_create_file_response();
        test_remote_file_and_pages();
        test_error_codes();
        test_crypto();
        test_chunk_plans();
        test_encryption_header();
        test_http_helpers();
        test_ranged_request_ignored_by_server();
        test_range_sources();
        run_cipher_component_tests();
        run_transfer_component_tests();
        run_client_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
