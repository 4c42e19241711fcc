// Generates seed corpus files for the merge-patch fuzz target.
// Each seed is "<base document>\n<merge patch>".
//
// Usage: ./generate_seeds <output_dir>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <output_dir>\n", argv[0]);
        return 1;
    }
    const auto out_dir = std::filesystem::path{argv[1]} / "merge_patch";
    std::filesystem::create_directories(out_dir);

    const auto seeds = std::vector<std::pair<std::string, std::string>>{
        {R"({"a":{"b":"c"},"d":"e"})", R"({"a":{"b":"f"}})"},
        {R"({"a":{"b":"c"},"d":"e"})", R"({"a":{"b":null}})"},
        {R"("leaf")", R"({"k":"v"})"},
        {R"({"k":"v"})", R"("flat")"},
        {R"({"k":"v"})", R"({"n":1})"},
        {R"({})", R"({"a":{"bb":{"ccc":null}}})"},
        {R"({"a":"b"})", R"(null)"},
    };

    for (std::size_t i = 0; i < seeds.size(); ++i) {
        auto out = std::ofstream{out_dir / ("seed_" + std::to_string(i))};
        out << seeds[i].first << '\n' << seeds[i].second;
    }
    std::printf("Generated %zu merge patch seeds in %s\n", seeds.size(), out_dir.c_str());
    return 0;
}
