#include <gtest/gtest.h>

#include <jsondoc/jsondoc.h>

using namespace jsondoc;

namespace {

class Tally : public Fragment
{
  public:
    using Fragment::Fragment;

    void increment() { set_value(value().to_int() + 1); }
};

class Settings : public Document
{
  public:
    using Document::Document;

    JSONDOC_READWRITE_BRIDGE(save_on_exit)
    JSONDOC_READWRITE_BRIDGE(theme)
    JSONDOC_READONLY_BRIDGE(version)
    JSONDOC_FRAGMENT_BRIDGE(launches, Tally)
    JSONDOC_FRAGMENT_BRIDGE(window, Fragment)
};

Value settings_schema() {
  return "{'type': 'object', 'properties': {"
         "'save_on_exit': {'type': 'boolean', 'default': true}, "
         "'theme': {'type': 'string', 'enum': ['light', 'dark'], 'default': 'light'}, "
         "'version': {'type': 'integer', 'default': 1}, "
         "'launches': {'type': 'integer', 'default': 0, '__fragment_cls': 'Tally'}, "
         "'window': {'type': 'object', 'default': {'width': 640, 'height': 480}}}}"_json;
}

} // namespace

TEST(Bridge, ReadDefaults) {
  register_fragment_class<Tally>("Tally");
  auto settings = Document::create<Settings>(Value{}, settings_schema());
  EXPECT_EQ(settings->save_on_exit(), true);
  EXPECT_EQ(settings->theme(), "light");
  EXPECT_EQ(settings->version(), 1);
  EXPECT_EQ(settings->value().without_defaults(), "{}"_json);
}

TEST(Bridge, Write) {
  auto settings = Document::create<Settings>(Value{}, settings_schema());
  settings->set_save_on_exit(false);
  settings->set_theme("dark");
  EXPECT_EQ(settings->save_on_exit(), false);
  EXPECT_EQ(settings->theme(), "dark");
  EXPECT_EQ(settings->value().without_defaults(), "{'save_on_exit': false, 'theme': 'dark'}"_json);
  EXPECT_FALSE(settings->validate().has_value());

  settings->set_theme("purple");
  auto error = settings->validate();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->value_path(), "object.theme");
}

TEST(Bridge, FragmentAccessor) {
  register_fragment_class<Tally>("Tally");
  auto settings = Document::create<Settings>(Value{}, settings_schema());
  settings->launches()->increment();
  settings->launches()->increment();
  EXPECT_EQ(settings->launches()->value(), 2);
  EXPECT_EQ(settings->launches()->path(), "launches"_path);

  auto window = settings->window();
  EXPECT_TRUE(window->is_default());
  window->set("width", 800);
  EXPECT_EQ(settings->value().without_defaults(), "{'launches': 2, 'window': {'width': 800, 'height': 480}}"_json);
}

TEST(Bridge, LoadedValues) {
  auto settings = Document::create<Settings>("{'theme': 'dark', 'version': 3}"_json, settings_schema());
  EXPECT_EQ(settings->theme(), "dark");
  EXPECT_EQ(settings->version(), 3);
  EXPECT_EQ(settings->save_on_exit(), true);
}
