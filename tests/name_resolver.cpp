#include "gitpile/errors.hpp"
#include "gitpile/naming.hpp"

#include <iostream>

int main() {
  gitpile::NameResolver names{3};
  if (names.claim("Fix-bug.patch") != "Fix-bug.patch") {
    std::cerr << "first claim should keep the name\n";
    return 1;
  }
  if (names.claim("Fix-bug.patch") != "Fix-bug-1.patch") {
    std::cerr << "second claim should get -1 before the extension\n";
    return 1;
  }
  if (names.claim("Other.patch") != "Other.patch") {
    std::cerr << "unrelated name changed\n";
    return 1;
  }
  // A subject that happens to look like a suffixed name pushes later collisions further
  if (names.claim("Fix-bug-2.patch") != "Fix-bug-2.patch") {
    std::cerr << "literal -2 name changed\n";
    return 1;
  }
  if (names.claim("Fix-bug.patch") != "Fix-bug-3.patch") {
    std::cerr << "collision should skip taken -2\n";
    return 1;
  }
  if (!names.taken("Fix-bug-1.patch") || names.taken("Fix-bug-4.patch")) {
    std::cerr << "taken() disagrees with claims\n";
    return 1;
  }

  // The same requests always produce the same names
  gitpile::NameResolver again{3};
  (void)again.claim("Fix-bug.patch");
  if (again.claim("Fix-bug.patch") != "Fix-bug-1.patch") {
    std::cerr << "naming is not deterministic\n";
    return 1;
  }

  gitpile::NameResolver tight{1};
  (void)tight.claim("Same.patch");
  (void)tight.claim("Same.patch");
  bool threw = false;
  try {
    (void)tight.claim("Same.patch");
  } catch (const gitpile::PatchNamingExhaustedError &) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "exceeding the retry bound did not throw\n";
    return 1;
  }

  // Subjects git sanitizes to nothing still yield *.patch names, suffix before the extension
  gitpile::NameResolver bare{3};
  const auto b1 = bare.claim(".patch");
  const auto b2 = bare.claim(".patch");
  const auto b3 = bare.claim("patch.patch");
  if (b1 != "patch.patch" || b2 != "patch-1.patch" || b3 != "patch-2.patch") {
    std::cerr << "bare names: " << b1 << " " << b2 << " " << b3 << "\n";
    return 1;
  }

  // Only the final ".patch" counts as the extension
  gitpile::NameResolver dotted{3};
  (void)dotted.claim("Bump-to-v1.2.patch");
  if (dotted.claim("Bump-to-v1.2.patch") != "Bump-to-v1.2-1.patch") {
    std::cerr << "dotted subject suffixed in the wrong place\n";
    return 1;
  }

  std::cout << "name resolver OK\n";
  return 0;
}
