#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <QCoreApplication>
#include <QLoggingCategory>

int main(int argc, char *argv[]) {
    // Qt SQL drivers are plugins and need an application instance to load
    QCoreApplication app(argc, argv);
    QLoggingCategory::setFilterRules("taskline.*.info=false\n");

    return Catch::Session().run(argc, argv);
}
