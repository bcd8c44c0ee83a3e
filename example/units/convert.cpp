#include "quanta/config.hpp"
#include "quanta/units/catalog_cache.hpp"
#include "quanta/units/conversion.hpp"

#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

using namespace quanta::units;

namespace {

auto usage(const char* program) -> int {
    std::cerr << "Usage: " << program
              << " [catalog.json] <value> <from-code> <to-code>" << std::endl;
    return 2;
}

auto lookup(const UnitCatalog& catalog, const std::string& code)
    -> UnitResult<const Unit*> {
    auto id = catalog.resolve(code);
    if (!id) {
        return makeUnitError(UnitErrorCode::DataIntegrityError,
                             "Unknown unit code '" + code + "'");
    }
    return catalog.find(*id);
}

}  // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    if (argc != 4 && argc != 5) {
        return usage(argv[0]);
    }
    const int first = argc - 3;
    const std::string source = argc == 5 ? argv[1] : QUANTA_DEFAULT_UNITS_MAP;
    const std::string value = argv[first];
    const std::string fromCode = argv[first + 1];
    const std::string toCode = argv[first + 2];

    CatalogCache cache;
    auto catalog = cache.load(source);
    if (!catalog) {
        std::cerr << catalog.error() << std::endl;
        return 1;
    }

    auto from = lookup(**catalog, fromCode);
    if (!from) {
        std::cerr << from.error() << std::endl;
        return 1;
    }
    auto to = lookup(**catalog, toCode);
    if (!to) {
        std::cerr << to.error() << std::endl;
        return 1;
    }

    // Exact conversion, then the canonical decimal form
    auto result = convertText(value, **from, **to);
    if (!result) {
        std::cerr << result.error() << std::endl;
        return 1;
    }
    std::cout << value << " " << fromCode << " = " << *result << " " << toCode
              << std::endl;
    return 0;
}
