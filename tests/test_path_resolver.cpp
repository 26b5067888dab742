#include "path_resolver.hpp"
#include "test_util.hpp"

#include <filesystem>
#include <iostream>

using haul::ErrorKind;
using haul::PathResolver;
using haul::Status;

int main() {
  namespace fs = std::filesystem;

  {
    PathResolver paths("/A/B", "/out/B");
    fs::path out;
    Status st = paths.resolve("/A/B/x/y.bin", out);
    HAUL_EXPECT(st.ok());
    HAUL_EXPECT(out == fs::path("/out/B/x/y.bin"));

    st = paths.resolve("x/y.bin", out);
    HAUL_EXPECT(st.ok());
    HAUL_EXPECT(out == fs::path("/out/B/x/y.bin"));

    st = paths.resolve("/A/B/x/../z.bin", out);
    HAUL_EXPECT(st.ok());
    HAUL_EXPECT(out == fs::path("/out/B/z.bin"));
  }

  {
    PathResolver paths("/A/B", "/out/B");
    fs::path out;
    const char* hostile[] = {
        "../../etc/passwd",
        "/etc/passwd",
        "/A/B/../../etc/passwd",
        "/A/B",
        "/A/Bogus/file",
        "x/../../y",
    };
    for (const char* name : hostile) {
      Status st = paths.resolve(name, out);
      if (st.ok() || st.kind != ErrorKind::SuspiciousPath) {
        std::cerr << "accepted hostile path " << name << "\n";
        return 1;
      }
    }
  }

  {
    haul_test::TempDir dir("haul_path_resolver_");
    PathResolver paths("/private/var/App.app", dir.path() / "App.app");
    fs::path out;
    Status st = paths.prepare("/private/var/App.app/Frameworks/Foo.framework/Foo", out);
    HAUL_EXPECT(st.ok());
    HAUL_EXPECT(fs::is_directory(out.parent_path()));
    HAUL_EXPECT(!fs::exists(out));

    st = paths.prepare("/private/var/Other.app/Foo", out);
    HAUL_EXPECT(st.kind == ErrorKind::SuspiciousPath);
    HAUL_EXPECT(!fs::exists(dir.path() / "Other.app"));
  }

  std::cout << "path resolver ok\n";
  return 0;
}
