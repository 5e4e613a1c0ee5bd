#include <cstdlib>
#include <fstream>

#include <QTemporaryDir>

#include <gtest/gtest.h>

#include "ModelLocator.h"

using namespace std;
namespace fs = std::filesystem;

namespace {

void touch(const fs::path& path, size_t bytes = 16) {
    fs::create_directories(path.parent_path());
    ofstream f{path, ios::binary};
    f << string(bytes, 'x');
}

ModelLocator locatorFor(const fs::path& root) {
    ModelSearchConfig cfg;
    cfg.include_default_paths = false;
    cfg.extra_search_paths.push_back(root);
    return ModelLocator{std::move(cfg)};
}

} // anon ns

TEST(ModelLocator, ParsesFileNames) {
    auto dm = ModelLocator::parse_file_name("/m/ggml-base.bin");
    EXPECT_EQ(dm.name, "base");
    EXPECT_EQ(dm.quantization_hint, "");

    dm = ModelLocator::parse_file_name("/m/ggml-small.en-q5_1.bin");
    EXPECT_EQ(dm.name, "small.en");
    EXPECT_EQ(dm.quantization_hint, "q5_1");

    dm = ModelLocator::parse_file_name("/m/ggml-large-v3.bin");
    EXPECT_EQ(dm.name, "large-v3");
    EXPECT_EQ(dm.quantization_hint, "");

    dm = ModelLocator::parse_file_name("/m/ggml-large-v3-Q8_0.BIN");
    EXPECT_EQ(dm.name, "large-v3");
    EXPECT_EQ(dm.quantization_hint, "q8_0");
}

TEST(ModelLocator, IgnoresOtherFiles) {
    EXPECT_TRUE(ModelLocator::parse_file_name("/m/base.bin").name.empty());
    EXPECT_TRUE(ModelLocator::parse_file_name("/m/ggml-.bin").name.empty());
    EXPECT_TRUE(ModelLocator::parse_file_name("/m/ggml-base.gguf").name.empty());
    EXPECT_TRUE(ModelLocator::parse_file_name("/m/README").name.empty());
}

TEST(ModelLocator, FindsModelsRecursively) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const fs::path root = tmp.path().toStdString();

    touch(root / "ggml-base.bin", 100);
    touch(root / "nested/deeper/ggml-tiny.en.bin");
    touch(root / "notes.txt");

    const auto locator = locatorFor(root);
    EXPECT_EQ(locator.available_models(), (vector<string>{"base", "tiny.en"}));

    const auto base = locator.find_model("base");
    ASSERT_TRUE(base);
    EXPECT_EQ(base->path, root / "ggml-base.bin");
    EXPECT_EQ(base->size_bytes, 100u);

    EXPECT_TRUE(locator.model_exists("tiny.en"));
    EXPECT_FALSE(locator.model_exists("tiny"));
    EXPECT_FALSE(locator.model_exists(""));
}

TEST(ModelLocator, PrefersQuantizationsInOrder) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const fs::path root = tmp.path().toStdString();

    touch(root / "ggml-small.bin");
    touch(root / "ggml-small-q4_0.bin");
    touch(root / "ggml-small-f16.bin");
    touch(root / "ggml-small-q5_0.bin");

    const auto locator = locatorFor(root);
    auto found = locator.find_model("small");
    ASSERT_TRUE(found);
    EXPECT_EQ(found->quantization_hint, "q5_0");

    fs::remove(root / "ggml-small-q5_0.bin");
    found = locator.find_model("small");
    ASSERT_TRUE(found);
    EXPECT_EQ(found->quantization_hint, "f16");

    // Unquantized beats a quantization we do not prefer
    fs::remove(root / "ggml-small-f16.bin");
    found = locator.find_model("small");
    ASSERT_TRUE(found);
    EXPECT_EQ(found->quantization_hint, "");
    EXPECT_EQ(found->path, root / "ggml-small.bin");
}

TEST(ModelLocator, ExtraPathsComeFirst) {
    QTemporaryDir a;
    QTemporaryDir b;
    ASSERT_TRUE(a.isValid() && b.isValid());
    const fs::path first = a.path().toStdString();
    const fs::path second = b.path().toStdString();

    touch(first / "ggml-base.bin");
    touch(second / "ggml-base.bin");

    ModelSearchConfig cfg;
    cfg.include_default_paths = false;
    cfg.extra_search_paths = {first, second};
    const ModelLocator locator{cfg};

    const auto found = locator.find_model("base");
    ASSERT_TRUE(found);
    EXPECT_EQ(found->path, first / "ggml-base.bin");
    EXPECT_EQ(locator.list_all_models().size(), 2u);
}

TEST(ModelLocator, MissingDirectoriesAreSkipped) {
    const auto locator = locatorFor("/nonexistent/qdictate/models");
    EXPECT_TRUE(locator.list_all_models().empty());
    EXPECT_FALSE(locator.find_model("base"));
}

TEST(ModelLocator, DefaultPathsFollowTheEnvironment) {
    const auto *old = getenv("WHISPER_MODELS_PATH");
    const string saved = old ? old : "";
    setenv("WHISPER_MODELS_PATH", "/opt/whisper-models", 1);

    ModelSearchConfig cfg;
    cfg.extra_search_paths.push_back("/first");
    const auto paths = ModelLocator{cfg}.effective_search_paths();

    ASSERT_GE(paths.size(), 2u);
    EXPECT_EQ(paths[0], fs::path{"/first"});
    EXPECT_EQ(paths[1], fs::path{"/opt/whisper-models"});

    if (old) {
        setenv("WHISPER_MODELS_PATH", saved.c_str(), 1);
    } else {
        unsetenv("WHISPER_MODELS_PATH");
    }
}
