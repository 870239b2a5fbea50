#include <cassert>
#include <iostream>
#include <sstream>
#include <fstream>
#include <cstdio>
#include <string>
#include "lifegrid.h"
#include "liferender.h"
#include "htmlrender.h"
#include "util.h"

// Captures status and warning messages instead of printing them
class captureerrors : public lifeerrors {
public:
    virtual void fatal(const char* s) {
        std::cout << "unexpected fatal error: " << s << "\n";
        assert(false);
    }
    virtual void warning(const char* s) { warnings.push_back(s); }
    virtual void status(const char* s) { statuses.push_back(s); }
    vector<std::string> warnings, statuses;
};

std::string read_file(const char* filename) {
    std::ifstream in(filename);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool file_exists(const char* filename) {
    FILE* f = fopen(filename, "r");
    if (f == 0)
        return false;
    fclose(f);
    return true;
}

lifegrid horizontal_blinker() {
    lifegrid grid(5, 3);
    grid.setcell(1, 1, 1);
    grid.setcell(1, 2, 1);
    grid.setcell(1, 3, 1);
    return grid;
}

void test_console_render() {
    std::ostringstream os;
    consolerender renderer(os);
    lifegrid grid = horizontal_blinker();
    assert(renderer.begin(grid) == 0);
    assert(renderer.render(0, grid) == 0);
    assert(os.str() == ".....\n.XXX.\n.....\nGeneration 0: population 3\n");
    assert(renderer.render(1, grid.nextgeneration()) == 0);
    assert(os.str() == ".....\n.XXX.\n.....\nGeneration 0: population 3\n"
                       "..X..\n..X..\n..X..\nGeneration 1: population 3\n");
    std::cout << "PASSED: test_console_render\n";
}

void test_console_render_inplace() {
    std::ostringstream os;
    consolerender renderer(os, 1);
    lifegrid grid(2, 1);
    assert(renderer.render(7, grid) == 0);
    assert(os.str() == "\033[H\033[2J..\nGeneration 7: population 0\n");
    std::cout << "PASSED: test_console_render_inplace\n";
}

void test_console_render_bad_stream() {
    std::ostringstream os;
    os.setstate(std::ios_base::badbit);
    consolerender renderer(os);
    assert(renderer.render(0, horizontal_blinker()) != 0);
    std::cout << "PASSED: test_console_render_bad_stream\n";
}

void test_html_render() {
    captureerrors errors;
    lifeerrors::seterrorhandler(&errors);
    const char* filename = "test_render_page.html";
    remove(filename);
    htmlrender renderer(filename, 2, "blinker & co");
    lifegrid grid = horizontal_blinker();

    assert(renderer.begin(grid) == 0);
    // the file name is reported once, at start
    assert(errors.statuses.size() == 1);
    assert(errors.statuses[0].find(filename) != std::string::npos);

    assert(renderer.render(0, grid) == 0);
    std::string page = read_file(filename);
    assert(page.find("<meta http-equiv=\"refresh\" content=\"2\">") != std::string::npos);
    assert(page.find("blinker &amp; co") != std::string::npos);
    assert(page.find("Generation 0: population 3") != std::string::npos);

    // 15 cells, 3 of them live
    size_t live = 0, dead = 0, pos = 0;
    while ((pos = page.find("<td class=\"live\">", pos)) != std::string::npos) { live++; pos++; }
    pos = 0;
    while ((pos = page.find("<td class=\"dead\">", pos)) != std::string::npos) { dead++; pos++; }
    assert(live == 3 && dead == 12);

    // each generation replaces the page
    assert(renderer.render(1, grid.nextgeneration()) == 0);
    page = read_file(filename);
    assert(page.find("Generation 1: population 3") != std::string::npos);
    assert(page.find("Generation 0:") == std::string::npos);
    assert(!file_exists("test_render_page.html.tmp"));

    // the last page stops the browser reloading
    renderer.end(1, grid.nextgeneration());
    page = read_file(filename);
    assert(page.find("http-equiv") == std::string::npos);
    assert(page.find("Generation 1: population 3") != std::string::npos);
    assert(errors.statuses.size() == 1);
    assert(errors.warnings.empty());

    remove(filename);
    lifeerrors::seterrorhandler(0);
    std::cout << "PASSED: test_html_render\n";
}

void test_html_render_unwritable() {
    captureerrors errors;
    lifeerrors::seterrorhandler(&errors);
    htmlrender renderer("no/such/dir/page.html", 1, "x");
    lifegrid grid = horizontal_blinker();
    assert(renderer.render(0, grid) != 0);
    renderer.end(0, grid);
    assert(errors.warnings.size() == 1);
    lifeerrors::seterrorhandler(0);
    std::cout << "PASSED: test_html_render_unwritable\n";
}

void test_html_default_name() {
    htmlrender renderer(0, 0, 0);
    assert(std::string(renderer.getfilename()) == DEFAULT_HTML_FILE);
    std::cout << "PASSED: test_html_default_name\n";
}

int main() {
    test_console_render();
    test_console_render_inplace();
    test_console_render_bad_stream();
    test_html_render();
    test_html_render_unwritable();
    test_html_default_name();

    std::cout << "\nAll render tests passed!\n";
    return 0;
}
