#include <jsondoc/jsondoc.h>

#include <iostream>

JSONDOC_INIT;

using namespace jsondoc;

class Settings : public Document
{
  public:
    using Document::Document;

    JSONDOC_READWRITE_BRIDGE(save_on_exit)
    JSONDOC_READONLY_BRIDGE(zoom)
    JSONDOC_READONLY_BRIDGE(recent)
};

int main() {
    auto schema = "{'type': 'object', 'properties': {"
                  "'save_on_exit': {'type': 'boolean', 'default': true}, "
                  "'zoom': {'type': 'number', 'default': 1.0}, "
                  "'recent': {'type': 'array', 'items': {'type': 'string'}, 'default': []}}}"_json;

    Value value;
    try {
        value = json::parse("{'zoom': 1.25, 'recent': ['todo.txt']}");
    } catch (const parse::SyntaxError& err) {
        std::cerr << err.what() << std::endl;
        return 1;
    }

    auto settings = Document::create<Settings>(value, schema);
    std::cout << "save_on_exit=" << settings->save_on_exit() << std::endl;
    std::cout << "zoom=" << settings->zoom() << std::endl;

    auto recent = settings->get("recent");
    recent->set(recent->size(), "notes.txt");
    std::cout << "recent=" << settings->recent() << std::endl;
    settings->set_save_on_exit(false);

    if (auto error = settings->validate()) {
        std::cerr << error->what() << std::endl;
        return 1;
    }

    // only the values that differ from the defaults are saved
    std::cout << settings->value().without_defaults().to_json(2) << std::endl;
}
