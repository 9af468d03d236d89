#include <cassert>
#include <filesystem>
#include <iostream>

#include "infrastructure/FileSystemImageScanner.hpp"
#include "TestSupport.hpp"

using namespace imagescout;
using infrastructure::FileSystemImageScanner;
using infrastructure::FingerprintMode;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting FileSystemImageScanner Test..." << std::endl;
    test::ScratchDir folder("imagescout_scanner_test");
    std::string jpg = folder.write("cat.JPG", "meow");
    std::string png = folder.write("dog.png", "woof");
    folder.write("readme.txt", "text");
    folder.write("noext", "bytes");
    folder.write("nested/deep.jpg", "not scanned");
    fs::create_directories(folder.path() / "album.jpg");

    FileSystemImageScanner scanner({".jpg", ".png"});
    assert(scanner.isSupported("/x/y.JpG"));
    assert(!scanner.isSupported("/x/y.jpeg"));

    auto identities = scanner.scan(folder.path().string());
    assert(identities.size() == 2);
    std::set<std::string> paths;
    for (const auto& id : identities) {
        paths.insert(id.path);
        assert(fs::path(id.path).is_absolute());
        assert(!id.fingerprint.empty());
    }
    assert(paths.count(jpg) == 1 && paths.count(png) == 1);

    // Same folder named differently scans to the same identities
    assert(scanner.scan(folder.path().string() + "/") == identities);
    assert(scanner.scan((folder.path() / "nested" / "..").string()) == identities);

    // Entries that cannot be inspected are skipped, not thrown
    fs::create_symlink(folder.path() / "gone.jpg", folder.path() / "dangling.jpg");
    assert(scanner.scan(folder.path().string()) == identities);

    // Missing folder is empty, not an error
    assert(scanner.scan((folder.path() / "nope").string()).empty());
    std::cout << "[PASS] Listing." << std::endl;

    // Size change shows up in the default fingerprint
    std::string before = scanner.fingerprint(jpg);
    folder.write("cat.JPG", "meow meow");
    assert(scanner.fingerprint(jpg) != before);

    // Content hash follows bytes, not timestamps
    FileSystemImageScanner hashing({".jpg", ".png"}, FingerprintMode::ContentHash);
    std::string hashed = hashing.fingerprint(png);
    folder.write("dog.png", "woof");
    assert(hashing.fingerprint(png) == hashed);
    folder.write("dog.png", "bark");
    assert(hashing.fingerprint(png) != hashed);
    std::string copy = folder.write("twin.png", "bark");
    assert(hashing.fingerprint(copy) == hashing.fingerprint(png));

    // Persisted fingerprints use 64-bit FNV-1a, identical across builds
    assert(hashing.fingerprint(folder.write("one.png", "a")) == "h1_af63dc4c8601ec8c");
    assert(hashing.fingerprint(folder.write("zero.png", "")) == "h0_cbf29ce484222325");
    std::cout << "[PASS] Fingerprints." << std::endl;

    std::cout << "[PASS] FileSystemImageScanner Test." << std::endl;
    return 0;
}
