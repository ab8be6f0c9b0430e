#include "remote_path.hpp"
#include <cassert>
#include <iostream>

static void test_build_without_token(){
    assert(RemotePathBuilder::build("/data/", "")=="/data/");
    assert(RemotePathBuilder::build("/data", "")=="/data/");
    assert(RemotePathBuilder::build("/data/", "   ")=="/data/");
}

static void test_build_with_token(){
    assert(RemotePathBuilder::build("/data/", "2023")=="/data/2023/");
    assert(RemotePathBuilder::build("/data", "2023")=="/data/2023/");
    assert(RemotePathBuilder::build("/data/", "/2023/")=="/data/2023/");
    assert(RemotePathBuilder::build("/data/", "//2023//")=="/data/2023/");
    assert(RemotePathBuilder::build("/data/", " 2024 ")=="/data/2024/");
    assert(RemotePathBuilder::build("/data/", "2024/q1")=="/data/2024/q1/");
    // absolute-looking tokens stay under the base
    assert(RemotePathBuilder::build("/data/", "/etc")=="/data/etc/");
    assert(RemotePathBuilder::build("/data/", "my reports")=="/data/my reports/");
}

static void test_traversal_detection(){
    assert(RemotePathBuilder::containsTraversal(".."));
    assert(RemotePathBuilder::containsTraversal("/../etc"));
    assert(RemotePathBuilder::containsTraversal("2024/../../etc/"));
    assert(!RemotePathBuilder::containsTraversal("2024"));
    assert(!RemotePathBuilder::containsTraversal("..hidden"));
    assert(!RemotePathBuilder::containsTraversal("a..b/c"));
    assert(!RemotePathBuilder::containsTraversal(""));
    // build stays permissive; rejection is the caller's decision
    assert(RemotePathBuilder::build("/data/", "../x")=="/data/../x/");
}

static void test_shell_quote(){
    assert(shellQuote("/data/2024/")=="'/data/2024/'");
    assert(shellQuote("/data/my reports/")=="'/data/my reports/'");
    assert(shellQuote("it's")=="'it'\\''s'");
    assert(shellQuote("$(reboot)")=="'$(reboot)'");
    assert(shellQuote("")=="''");
}

int main(){
    test_build_without_token();
    test_build_with_token();
    test_traversal_detection();
    test_shell_quote();
    std::cout << "All remote path tests passed" << std::endl;
    return 0;
}
