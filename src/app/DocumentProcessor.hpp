#pragma once

#include "../output/ISink.hpp"
#include "../processing/Segmenter.hpp"
#include "../translate/BatchScheduler.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace app
{

// A source file after reading and segmentation, ready for a document worker.
struct PreparedDocument
{
    std::filesystem::path source;
    std::string original;
    processing::SegmentedDocument document;
    std::size_t translatable = 0;

    static bool load(const std::filesystem::path& path, const processing::SegmentOptions& options,
                     PreparedDocument& out, std::string& error);
};

struct DocumentOptions
{
    std::filesystem::path input_root;
    // Empty translates in place.
    std::filesystem::path output_root;
    bool backup = true;
    bool stream_writes = false;
};

// Translates one document and hands the result to the sink. With streaming on,
// every in-order prefix is written as soon as it is ready; when translation then
// fails, the original text is written back over the partial output.
class DocumentProcessor
{
public:
    DocumentProcessor(translate::BatchScheduler& scheduler, output::ISink& sink, DocumentOptions options);

    void setProgressObserver(translate::IProgressObserver* observer) { progress_ = observer; }
    void setRetryObserver(translate::IRetryObserver* observer) { retry_ = observer; }

    bool process(PreparedDocument& doc, std::string& error);

    std::filesystem::path destinationFor(const std::filesystem::path& source) const;

private:
    translate::BatchScheduler& scheduler_;
    output::ISink& sink_;
    DocumentOptions options_;
    translate::IProgressObserver* progress_ = nullptr;
    translate::IRetryObserver* retry_ = nullptr;
};

} // namespace app
