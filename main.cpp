#include <iostream>
#include <QString>
#include <cstdlib>
#include <vector>
#include <QCoreApplication>
#include "LangJsonConverter.hpp"
#include "Settings.hpp"
#include "Report.hpp"
#include "Menu.hpp"

int usage(const char *argv0, const int ret)
{
    auto &out = ret ? std::cerr : std::cout;
    out << "Usage: " << argv0 << " [options...]\n"
        << "Without --mode, an interactive menu asks which conversion to run.\n"
        << "Options:\n"
        << "  --input DIR      Directory containing the .lang/.json files (default ./input)\n"
        << "  --output DIR     Directory receiving the converted files (default ./output)\n"
        << "  --mode MODE      Convert once and exit. MODE is lang2json, json2lang or both\n"
        << "  --config FILE    Read paths/input and paths/output from an INI file\n"
        << "                   (default: " << defaultConfigFile.toStdString() << " if it exists)\n"
        << "  --help, -h       Show this help\n";
    return ret;
}

namespace
{

bool runBatch(const Settings &settings, const LangJsonConverter::Mode mode)
{
    LangJsonConverter::BatchResult result;
    const auto code = LangJsonConverter::convert(settings.inputDir, settings.outputDir, mode, result);
    if (code != LangJsonConverter::ReturnValue::CONVERT_SUCCESS)
    {
        LangJsonConverter::printAborted(code, settings.inputDir, std::cout);
        return false;
    }
    LangJsonConverter::printSummary(result, std::cout);
    return !result.hasFailures();
}

}

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("lang-json-converter");

    // parse arguments
    std::vector<QString> args(argv + 1, argv + argc);
    CommandLine commandLine;
    QString error;
    if (!parseCommandLine(args, commandLine, error))
    {
        std::cerr << error.toStdString() << "\n";
        return usage(argv[0], 1);
    }
    if (commandLine.showHelp)
        return usage(argv[0], 0);

    Settings settings;
    if (!resolveSettings(commandLine, settings, error))
    {
        std::cerr << error.toStdString() << "\n";
        return EXIT_FAILURE;
    }

    if (LangJsonConverter::prepareDirectories(settings.inputDir, settings.outputDir) !=
        LangJsonConverter::ReturnValue::CONVERT_SUCCESS)
        return EXIT_FAILURE;

    if (settings.runOnce)
        return runBatch(settings, settings.mode) ? EXIT_SUCCESS : EXIT_FAILURE;

    LangJsonConverter::Mode mode;
    while (promptForMode(std::cin, std::cout, mode))
        runBatch(settings, mode);
    return EXIT_SUCCESS;
}
