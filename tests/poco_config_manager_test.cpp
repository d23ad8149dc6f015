#include "test_base.hpp"
#include "core/poco_config_manager.hpp"
#include <fstream>

class PocoConfigManagerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        PocoConfigManager::getInstance().clear();
    }

    void TearDown() override
    {
        PocoConfigManager::getInstance().clear();
        TestBase::TearDown();
    }
};

TEST_F(PocoConfigManagerTest, EmptyConfigYieldsDefaults)
{
    auto &config = PocoConfigManager::getInstance();
    EXPECT_EQ(config.getInversionConfig(), InversionConfig());

    ConcurrencyOptions options = config.getConcurrencyOptions();
    EXPECT_EQ(options.worker_backend, WorkerBackend::PROCESS);
    EXPECT_EQ(options.max_workers, ConcurrencyOptions::DEFAULT_MAX_WORKERS);
    EXPECT_EQ(config.getLogLevel(), "INFO");
}

TEST_F(PocoConfigManagerTest, LoadsJsonFile)
{
    std::string path = createFile("config.json", R"({
        "background_color": "#1A1A1A",
        "foreground_color": "F0F0F0",
        "invert_images": false,
        "image_quality": 60,
        "file_suffix": "(dark)",
        "output_folder": "Dark",
        "force_slide_background": true,
        "worker_backend": "thread",
        "max_workers": 4,
        "log_level": "DEBUG"
    })");

    auto &config = PocoConfigManager::getInstance();
    ASSERT_TRUE(config.load(path));

    InversionConfig inversion = config.getInversionConfig();
    EXPECT_EQ(inversion.backgroundColor(), RgbColor(0x1A, 0x1A, 0x1A));
    EXPECT_EQ(inversion.foregroundColor(), RgbColor(0xF0, 0xF0, 0xF0));
    EXPECT_FALSE(inversion.invertImages());
    EXPECT_EQ(inversion.imageQuality(), 60);
    EXPECT_EQ(inversion.fileSuffix(), "(dark)");
    EXPECT_EQ(inversion.outputFolder(), "Dark");
    EXPECT_TRUE(inversion.forceSlideBackground());

    ConcurrencyOptions options = config.getConcurrencyOptions();
    EXPECT_EQ(options.worker_backend, WorkerBackend::THREAD);
    EXPECT_EQ(options.max_workers, 4u);
    EXPECT_EQ(config.getLogLevel(), "DEBUG");
}

TEST_F(PocoConfigManagerTest, LoadsYamlFile)
{
    std::string path = createFile("config.yaml",
                                  "background_color: \"000000\"\n"
                                  "foreground_color: FFFFFF\n"
                                  "image_quality: 90\n"
                                  "invert_images: true\n"
                                  "file_suffix: \"\"\n"
                                  "max_workers: 3\n");

    auto &config = PocoConfigManager::getInstance();
    ASSERT_TRUE(config.load(path));

    InversionConfig inversion = config.getInversionConfig();
    EXPECT_EQ(inversion.backgroundColor(), RgbColor(0, 0, 0));
    EXPECT_EQ(inversion.foregroundColor(), RgbColor(255, 255, 255));
    EXPECT_EQ(inversion.imageQuality(), 90);
    EXPECT_EQ(inversion.fileSuffix(), "");
    EXPECT_EQ(config.getConcurrencyOptions().max_workers, 3u);
}

TEST_F(PocoConfigManagerTest, MissingOrBrokenFileKeepsCurrentValues)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"image_quality", 42}});

    EXPECT_FALSE(config.load(getTestFilesDir() + "/does_not_exist.json"));
    EXPECT_FALSE(config.load(createFile("broken.json", "{ not json")));
    EXPECT_EQ(config.getInversionConfig().imageQuality(), 42);
}

TEST_F(PocoConfigManagerTest, UpdateOverridesLoadedValues)
{
    auto &config = PocoConfigManager::getInstance();
    ASSERT_TRUE(config.load(createFile("config.json", R"({"background_color": "#000000", "max_workers": 2})")));

    config.update({{"background_color", "#202020"}, {"max_workers", 6}, {"worker_backend", "thread"}});

    EXPECT_EQ(config.getInversionConfig().backgroundColor(), RgbColor(0x20, 0x20, 0x20));
    EXPECT_EQ(config.getConcurrencyOptions().max_workers, 6u);
    EXPECT_EQ(config.getString("background_color", ""), "#202020");
}

TEST_F(PocoConfigManagerTest, InvalidValuesRaiseConfigError)
{
    auto &config = PocoConfigManager::getInstance();

    config.update({{"foreground_color", "#12"}});
    EXPECT_THROW(config.getInversionConfig(), ConfigError);

    config.clear();
    config.update({{"image_quality", 0}});
    EXPECT_THROW(config.getInversionConfig(), ConfigError);

    config.clear();
    config.update({{"max_workers", 0}});
    EXPECT_THROW(config.getConcurrencyOptions(), ConfigError);

    config.clear();
    config.update({{"worker_backend", "gpu"}});
    EXPECT_THROW(config.getConcurrencyOptions(), ConfigError);

    config.clear();
    config.update({{"image_quality", "high"}});
    EXPECT_THROW(config.getInversionConfig(), ConfigError);
}

TEST_F(PocoConfigManagerTest, SavesAndReloadsYaml)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"background_color", "#101010"}, {"image_quality", 77}, {"invert_images", false}});

    std::string path = getTestFilesDir() + "/saved.yaml";
    ASSERT_TRUE(config.save(path));

    config.clear();
    ASSERT_TRUE(config.load(path));
    InversionConfig inversion = config.getInversionConfig();
    EXPECT_EQ(inversion.backgroundColor(), RgbColor(0x10, 0x10, 0x10));
    EXPECT_EQ(inversion.imageQuality(), 77);
    EXPECT_FALSE(inversion.invertImages());
}
