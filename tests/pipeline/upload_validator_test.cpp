/**
 * @file upload_validator_test.cpp
 * @brief Unit tests for upload media type and size checks
 */

#include <catch2/catch_test_macros.hpp>

#include <sgkdoc/pipeline/upload_validator.hpp>

using namespace sgkdoc;
using namespace sgkdoc::pipeline;

namespace {

uploaded_file make_upload(std::string media_type, std::size_t size) {
    uploaded_file file;
    file.media_type = std::move(media_type);
    file.file_name = "scan.bin";
    file.bytes.assign(size, 0x41);
    return file;
}

}  // namespace

TEST_CASE("Allowed media types pass", "[pipeline][validator]") {
    upload_validator validator;

    for (const char* type :
         {"image/jpeg", "image/jpg", "image/png", "image/tiff", "application/pdf"}) {
        INFO(type);
        CHECK(validator.validate(make_upload(type, 1024)).is_ok());
    }

    CHECK(validator.validate(make_upload(" IMAGE/PNG ", 1024)).is_ok());
}

TEST_CASE("Rejected uploads carry user-facing messages", "[pipeline][validator]") {
    upload_validator validator;

    SECTION("unsupported type") {
        auto result = validator.validate(make_upload("text/plain", 10));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::unsupported_media_type);
        CHECK(result.error().message == unsupported_type_message);
    }

    SECTION("empty file") {
        auto result = validator.validate(make_upload("image/png", 0));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::empty_file);
    }

    SECTION("size limit is inclusive") {
        pipeline_config config;
        config.max_upload_bytes = 100;
        upload_validator small(config);

        CHECK(small.validate(make_upload("image/png", 100)).is_ok());

        auto result = small.validate(make_upload("image/png", 101));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::file_too_large);
        CHECK(result.error().message == file_too_large_message);
    }

    SECTION("default limit is 15 MB") {
        auto result = validator.validate(make_upload("image/jpeg", 15 * 1024 * 1024 + 1));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::file_too_large);
    }
}

TEST_CASE("Effective format prefers magic bytes", "[pipeline][validator]") {
    uploaded_file file;
    file.media_type = "image/jpeg";
    file.bytes = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0, 0, 0, 0};
    CHECK(upload_validator::effective_format(file) == imaging::image_format::png);

    file.bytes = {0x00, 0x01, 0x02};
    CHECK(upload_validator::effective_format(file) == imaging::image_format::jpeg);

    file.media_type = "application/pdf";
    CHECK(upload_validator::effective_format(file) == imaging::image_format::pdf);
}
