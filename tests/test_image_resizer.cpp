#define BOOST_TEST_MODULE ImageResizerTests
#include <boost/test/unit_test.hpp>

#include "imgresize/ImageResizer.hpp"
#include "TestImages.hpp"

#include <sstream>

using namespace imgresize;
using namespace imgresize::testing;
namespace fs = std::filesystem;

BOOST_AUTO_TEST_SUITE(OutputPathDerivation)

BOOST_AUTO_TEST_CASE(suffix_before_extension) {
    BOOST_CHECK_EQUAL(derive_output_path("photo.jpg").string(), "photo_1024x1024.jpg");
}

BOOST_AUTO_TEST_CASE(stays_in_input_directory) {
    BOOST_CHECK_EQUAL(derive_output_path("a/b/image.PNG").string(),
                      (fs::path("a/b") / "image_1024x1024.PNG").string());
}

BOOST_AUTO_TEST_CASE(uses_requested_dimensions) {
    BOOST_CHECK_EQUAL(derive_output_path("tex.png", {512, 256}).string(), "tex_512x256.png");
}

BOOST_AUTO_TEST_CASE(only_last_extension_is_split) {
    BOOST_CHECK_EQUAL(derive_output_path("archive.v2.bmp").string(), "archive.v2_1024x1024.bmp");
    BOOST_CHECK_EQUAL(derive_output_path("noext").string(), "noext_1024x1024");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SingleImage)

BOOST_AUTO_TEST_CASE(output_has_exact_target_dimensions) {
    TempDir dir;
    write_png(dir / "in.png", 64, 64);

    for (const Dimensions target : {Dimensions{32, 32}, Dimensions{100, 100}, Dimensions{20, 48}}) {
        std::ostringstream status;
        ResizeRequest request;
        request.input_path = dir / "in.png";
        request.output_path = dir / "out.png";
        request.target = target;

        const ResizeResult result = resize_image(request, status);
        BOOST_REQUIRE(result.success);
        BOOST_CHECK(result.original == (Dimensions{64, 64}));
        BOOST_CHECK(result.output == target);

        const Image written = ImageCodec::load((dir / "out.png").string());
        BOOST_CHECK(written.dimensions() == target);
    }
}

BOOST_AUTO_TEST_CASE(default_target_and_derived_path) {
    TempDir dir;
    write_png(dir / "small.png", 128, 128);

    std::ostringstream status;
    ResizeRequest request;
    request.input_path = dir / "small.png";

    const ResizeResult result = resize_image(request, status);
    BOOST_REQUIRE(result.success);
    BOOST_CHECK_EQUAL(result.output_path.string(), (dir / "small_1024x1024.png").string());

    const Image written = ImageCodec::load(result.output_path.string());
    BOOST_CHECK(written.dimensions() == kDefaultTarget);
}

BOOST_AUTO_TEST_CASE(non_2048_input_warns_but_succeeds) {
    TempDir dir;
    write_png(dir / "in.png", 40, 40);

    std::ostringstream status;
    ResizeRequest request;
    request.input_path = dir / "in.png";
    request.output_path = dir / "out.png";
    request.target = {20, 20};

    BOOST_CHECK(resize_image(request, status).success);

    const std::string log = status.str();
    BOOST_CHECK(log.find("Original image size: 40 x 40") != std::string::npos);
    BOOST_CHECK(log.find("Warning: Input image is not 2048x2048") != std::string::npos);
    BOOST_CHECK(log.find("Saved to: ") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(expected_source_size_does_not_warn) {
    TempDir dir;
    ImageCodec::save(make_solid(2048, 2048, 1, 90), (dir / "big.png").string(), ImageFormat::PNG);

    std::ostringstream status;
    ResizeRequest request;
    request.input_path = dir / "big.png";

    const ResizeResult result = resize_image(request, status);
    BOOST_REQUIRE(result.success);
    BOOST_CHECK(result.output == kDefaultTarget);
    BOOST_CHECK(status.str().find("Warning") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(same_size_resize_is_exact_copy) {
    TempDir dir;
    const Image original = make_gradient(24, 24, 3);
    ImageCodec::save(original, (dir / "in.png").string(), ImageFormat::PNG);

    std::ostringstream status;
    ResizeRequest request;
    request.input_path = dir / "in.png";
    request.output_path = dir / "again.png";
    request.target = {24, 24};

    BOOST_REQUIRE(resize_image(request, status).success);

    const Image written = ImageCodec::load((dir / "again.png").string());
    BOOST_CHECK(written.dimensions() == (Dimensions{24, 24}));
    BOOST_CHECK(written.data == original.data);
}

BOOST_AUTO_TEST_CASE(format_follows_output_extension) {
    TempDir dir;
    write_png(dir / "in.png", 32, 32);

    std::ostringstream status;
    ResizeRequest request;
    request.input_path = dir / "in.png";
    request.output_path = dir / "out.jpg";
    request.target = {16, 16};

    BOOST_REQUIRE(resize_image(request, status).success);

    // JPEG starts with the SOI marker
    std::ifstream in(dir / "out.jpg", std::ios::binary);
    unsigned char header[2] = {0, 0};
    in.read(reinterpret_cast<char*>(header), 2);
    BOOST_CHECK_EQUAL(header[0], 0xFF);
    BOOST_CHECK_EQUAL(header[1], 0xD8);
}

BOOST_AUTO_TEST_CASE(creates_missing_output_directory) {
    TempDir dir;
    write_png(dir / "in.png", 32, 32);

    std::ostringstream status;
    ResizeRequest request;
    request.input_path = dir / "in.png";
    request.output_path = dir / "nested" / "deeper" / "out.png";
    request.target = {8, 8};

    BOOST_REQUIRE(resize_image(request, status).success);
    BOOST_CHECK(fs::exists(dir / "nested" / "deeper" / "out.png"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(Failures)

BOOST_AUTO_TEST_CASE(missing_input_is_not_found) {
    TempDir dir;
    std::ostringstream status;
    ResizeRequest request;
    request.input_path = dir / "missing.png";

    const ResizeResult result = resize_image(request, status);

    BOOST_CHECK(!result.success);
    BOOST_REQUIRE(result.error.has_value());
    BOOST_CHECK(result.error->kind == ErrorKind::NotFound);
    BOOST_CHECK(!fs::exists(dir / "missing_1024x1024.png"));
    BOOST_CHECK(status.str().find("Could not find the file") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(directory_input_is_not_found) {
    TempDir dir;
    fs::create_directories(dir / "folder.png");

    std::ostringstream status;
    ResizeRequest request;
    request.input_path = dir / "folder.png";

    const ResizeResult result = resize_image(request, status);
    BOOST_REQUIRE(result.error.has_value());
    BOOST_CHECK(result.error->kind == ErrorKind::NotFound);
}

BOOST_AUTO_TEST_CASE(corrupt_input_is_decode_error) {
    TempDir dir;
    write_garbage(dir / "bad.png");

    std::ostringstream status;
    ResizeRequest request;
    request.input_path = dir / "bad.png";
    request.output_path = dir / "out.png";

    const ResizeResult result = resize_image(request, status);
    BOOST_REQUIRE(result.error.has_value());
    BOOST_CHECK(result.error->kind == ErrorKind::DecodeError);
    BOOST_CHECK(!result.error->message.empty());
    BOOST_CHECK(!fs::exists(dir / "out.png"));
}

BOOST_AUTO_TEST_CASE(unwritable_output_is_io_error) {
    TempDir dir;
    write_png(dir / "in.png", 16, 16);
    // A regular file where the parent directory should be
    write_garbage(dir / "blocker");

    std::ostringstream status;
    ResizeRequest request;
    request.input_path = dir / "in.png";
    request.output_path = dir / "blocker" / "out.png";
    request.target = {8, 8};

    const ResizeResult result = resize_image(request, status);
    BOOST_REQUIRE(result.error.has_value());
    BOOST_CHECK(result.error->kind == ErrorKind::IOError);
}

BOOST_AUTO_TEST_CASE(unsupported_output_extension_fails_without_writing) {
    TempDir dir;
    write_png(dir / "in.png", 16, 16);

    std::ostringstream status;
    ResizeRequest request;
    request.input_path = dir / "in.png";
    request.output_path = dir / "out.gif";
    request.target = {8, 8};

    const ResizeResult result = resize_image(request, status);
    BOOST_REQUIRE(result.error.has_value());
    BOOST_CHECK(result.error->kind == ErrorKind::Other);
    BOOST_CHECK(!fs::exists(dir / "out.gif"));
}

BOOST_AUTO_TEST_CASE(non_positive_target_is_invalid_argument) {
    TempDir dir;
    write_png(dir / "in.png", 16, 16);

    std::ostringstream status;
    ResizeRequest request;
    request.input_path = dir / "in.png";
    request.target = {0, 1024};

    const ResizeResult result = resize_image(request, status);
    BOOST_REQUIRE(result.error.has_value());
    BOOST_CHECK(result.error->kind == ErrorKind::InvalidArgument);
    BOOST_CHECK_EQUAL(std::string(to_string(result.error->kind)), "InvalidArgument");
}

BOOST_AUTO_TEST_SUITE_END()
