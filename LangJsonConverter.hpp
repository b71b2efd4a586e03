#pragma once

#include <functional>
#include <vector>
#include <QObject>
#include <QString>

/// Batch conversion of a directory of .lang and .json localization files.
namespace LangJsonConverter
{

Q_NAMESPACE

enum class Mode
{
    LangToJson,
    JsonToLang,
    Both
};
Q_ENUM_NS(Mode)

enum class ReturnValue
{
    CONVERT_SUCCESS,
    ERR_INPUT_DIR_NOT_FOUND,
    ERR_INPUT_DIR_UNREADABLE,
    ERR_DIR_CREATION_FAILED
};
Q_ENUM_NS(ReturnValue)

/// Why one file could not be converted. stem is the file name without its extension.
struct FailureRecord
{
    QString stem;
    QString message;
};

struct ConvertedFile
{
    QString inputPath;
    QString outputPath;
};

struct BatchResult
{
    std::vector<FailureRecord> failedReads;
    std::vector<FailureRecord> failedWrites;
    std::vector<ConvertedFile> converted;

    bool hasFailures() const { return !failedReads.empty() || !failedWrites.empty(); }
};

/// Called once for every file written successfully.
using ProgressCallback = std::function<void(const QString &inputPath, const QString &outputPath)>;

/// Prints "<inputPath> => <outputPath>" to standard output.
void printProgress(const QString &inputPath, const QString &outputPath);

/**
 * @brief Create the input and output directories if they don't exist yet.
 *
 * A notice is printed for every directory that had to be created.
 *
 * @retval ReturnValue::CONVERT_SUCCESS          - Both directories exist
 * @retval ReturnValue::ERR_DIR_CREATION_FAILED  - One of them could not be created
 */
ReturnValue prepareDirectories(const QString &inputDir, const QString &outputDir);

/**
 * @brief Convert every matching file of inputDir and write the results to outputDir.
 *
 * Files are visited in directory order. With Mode::LangToJson only *.lang files are
 * converted, with Mode::JsonToLang only *.json files, and Mode::Both handles both
 * in one pass. Files with any other extension are ignored.
 *
 * The output of "<inputDir>/name.lang" is "<outputDir>/name.json" and vice versa.
 * A file that cannot be parsed lands in result.failedReads and is not written; a
 * file whose output cannot be written lands in result.failedWrites. Neither stops
 * the batch.
 *
 * @param inputDir Directory to scan. Subdirectories are not descended into.
 * @param outputDir Directory receiving the converted files, created on demand.
 * @param mode Which conversions to perform.
 * @param result Receives the failure logs and the list of converted files.
 * @param progress Invoked after each successful write.
 *
 * @return Return code indicating the result of the operation
 * @retval ReturnValue::CONVERT_SUCCESS           - Every file was visited (see result for failures)
 * @retval ReturnValue::ERR_INPUT_DIR_NOT_FOUND   - inputDir doesn't exist
 * @retval ReturnValue::ERR_INPUT_DIR_UNREADABLE  - inputDir can't be listed
 */
ReturnValue convert(
    const QString &inputDir,
    const QString &outputDir,
    Mode mode,
    BatchResult &result,
    const ProgressCallback &progress = printProgress);

QString modeName(Mode mode);

};
