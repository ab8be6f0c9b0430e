#include "path_resolver.hpp"
#include "fake_transport.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <unistd.h>

namespace fs = std::filesystem;

static bool has_item(const TransferPlan& plan, const std::string& name, ItemKind kind){
    return std::ranges::any_of(plan, [&](const TransferItem& i){ return i.basename==name && i.kind==kind; });
}

static void test_single_file(){
    auto d = make_temp_dir("resolve_file");
    write_file(d/"report.csv", "a,b");
    PathResolver resolver;
    auto plan = resolver.resolve((d/"report.csv").string());
    assert(plan && plan->size()==1);
    assert((*plan)[0].kind==ItemKind::File);
    assert((*plan)[0].basename=="report.csv");
    assert((*plan)[0].localPath.is_absolute());
    assert(fs::equivalent((*plan)[0].localPath, d/"report.csv"));
}

static void test_directory(){
    auto d = make_temp_dir("resolve_dir");
    write_file(d/"proj"/"a.txt", "a");
    write_file(d/"proj"/"b.txt", "b");
    PathResolver resolver;
    auto plan = resolver.resolve((d/"proj").string());
    assert(plan && plan->size()==1);
    assert((*plan)[0].kind==ItemKind::Directory);
    assert((*plan)[0].basename=="proj");

    // trailing separator still names the directory itself
    auto slashed = resolver.resolve((d/"proj").string() + "/");
    assert(slashed && slashed->size()==1);
    assert((*slashed)[0].basename=="proj");
}

static void test_wildcard_matches(){
    auto d = make_temp_dir("resolve_glob");
    write_file(d/"a.log", "1");
    write_file(d/"b.log", "2");
    write_file(d/"c.txt", "3");
    write_file(d/"old.log"/"inner.txt", "4"); // directory matching the pattern
    write_file(d/".hidden.log", "5");
    PathResolver resolver;
    auto plan = resolver.resolve((d/"*.log").string());
    assert(plan && plan->size()==3);
    assert(has_item(*plan, "a.log", ItemKind::File));
    assert(has_item(*plan, "b.log", ItemKind::File));
    assert(has_item(*plan, "old.log", ItemKind::Directory));
    assert(!has_item(*plan, ".hidden.log", ItemKind::File));

    auto single = resolver.resolve((d/"?.txt").string());
    assert(single && single->size()==1 && (*single)[0].basename=="c.txt");
}

static void test_wildcard_no_match_is_empty_plan(){
    auto d = make_temp_dir("resolve_glob_empty");
    write_file(d/"a.txt", "1");
    PathResolver resolver;
    auto plan = resolver.resolve((d/"*.log").string());
    assert(plan.has_value());
    assert(plan->empty());

    auto missingDir = resolver.resolve((d/"nope"/"*.log").string());
    assert(missingDir.has_value() && missingDir->empty());
}

static void test_missing_source(){
    auto d = make_temp_dir("resolve_missing");
    PathResolver resolver;
    auto plan = resolver.resolve((d/"does_not_exist.bin").string());
    assert(!plan.has_value());
    assert(plan.error().kind==TransferErrorKind::SourceNotFound);
    assert(plan.error().message.find("does_not_exist.bin")!=std::string::npos);
}

static void test_pattern_matching(){
    assert(PathResolver::matchesPattern("*.log", "app.log"));
    assert(!PathResolver::matchesPattern("*.log", "app.log.1"));
    assert(PathResolver::matchesPattern("app-??.log", "app-01.log"));
    assert(!PathResolver::matchesPattern("app-??.log", "app-1.log"));
    assert(PathResolver::matchesPattern("*", "anything"));
    assert(!PathResolver::matchesPattern("*", ".profile"));
    assert(PathResolver::matchesPattern(".*", ".profile"));
    assert(PathResolver::matchesPattern("a*b*c", "aXXbYYc"));
    assert(!PathResolver::matchesPattern("a*b*c", "aXXbYY"));
    assert(PathResolver::hasWildcard("data/*.csv"));
    assert(PathResolver::hasWildcard("x?"));
    assert(!PathResolver::hasWildcard("plain/path"));
}

static void test_walk_directory(){
    auto d = make_temp_dir("walk_tree");
    write_file(d/"proj"/"a.txt", "a");
    write_file(d/"proj"/"src"/"main.cpp", "int main(){}");
    fs::create_directories(d/"proj"/"empty");

    auto entries = PathResolver::walkDirectory(d/"proj");
    assert(entries && entries->size()==4);
    auto find = [&](const std::string& rel){
        return std::ranges::find_if(*entries, [&](const LocalEntry& e){ return e.relative==rel; });
    };
    assert(find("a.txt")!=entries->end() && !find("a.txt")->directory);
    assert(find("src")!=entries->end() && find("src")->directory);
    assert(find("empty")!=entries->end() && find("empty")->directory);
    // parents are listed before their children
    assert(find("src") < find("src/main.cpp"));

    auto missing = PathResolver::walkDirectory(d/"gone");
    assert(!missing && missing.error().kind==TransferErrorKind::TransportFailure);
    assert(missing.error().message.find("Failed to read local directory")!=std::string::npos);
}

static void test_walk_unreadable_subdirectory(){
    // root reads through mode 000, so the check only means something for other users
    if (::geteuid()==0) return;
    auto d = make_temp_dir("walk_locked");
    write_file(d/"proj"/"a.txt", "a");
    write_file(d/"proj"/"locked"/"secret.txt", "s");
    fs::permissions(d/"proj"/"locked", fs::perms::none);

    auto entries = PathResolver::walkDirectory(d/"proj");
    fs::permissions(d/"proj"/"locked", fs::perms::owner_all);
    assert(!entries);
    assert(entries.error().kind==TransferErrorKind::TransportFailure);
}

int main(){
    test_single_file();
    test_directory();
    test_wildcard_matches();
    test_wildcard_no_match_is_empty_plan();
    test_missing_source();
    test_pattern_matching();
    test_walk_directory();
    test_walk_unreadable_subdirectory();
    std::cout << "All path resolver tests passed" << std::endl;
    return 0;
}
