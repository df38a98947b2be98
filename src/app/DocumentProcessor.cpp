#include "DocumentProcessor.hpp"
#include "../output/OrderedEmitter.hpp"
#include "../utils/FileUtils.hpp"

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace app
{

bool PreparedDocument::load(const fs::path& path, const processing::SegmentOptions& options, PreparedDocument& out,
                            std::string& error)
{
    out.source = path;
    if (!utils::read_text(path, out.original, error))
        return false;
    out.document = {};
    if (!processing::segment_document(out.original, options, out.document, error))
        return false;
    out.translatable = out.document.translatableCount();
    return true;
}

DocumentProcessor::DocumentProcessor(translate::BatchScheduler& scheduler, output::ISink& sink,
                                     DocumentOptions options)
    : scheduler_(scheduler)
    , sink_(sink)
    , options_(std::move(options))
{
}

fs::path DocumentProcessor::destinationFor(const fs::path& source) const
{
    if (options_.output_root.empty())
        return source;

    fs::path rel = source.lexically_relative(options_.input_root);
    if (rel.empty() || rel == ".")
        rel = source.filename();
    return options_.output_root / rel;
}

bool DocumentProcessor::process(PreparedDocument& doc, std::string& error)
{
    const fs::path destination = destinationFor(doc.source);
    const bool in_place = destination == doc.source;
    const bool backup_required = options_.backup && in_place;

    std::size_t writes = 0;
    output::OrderedEmitter emitter(doc.document, [&](const std::string& chunk) {
        output::WriteTask task;
        task.path = destination;
        task.content = chunk;
        task.backup = backup_required && writes == 0;
        task.mode = writes == 0 ? output::WriteMode::Replace : output::WriteMode::Append;
        sink_.submit(std::move(task));
        ++writes;
    });

    translate::Observers observers;
    observers.progress = progress_;
    observers.retry = retry_;
    if (options_.stream_writes)
        observers.segment = &emitter;

    const auto result = scheduler_.translate(doc.document.segments, observers);
    if (!result.success)
    {
        error = result.error_message;
        if (writes > 0)
        {
            PLOG_WARNING << "Restoring " << destination.string() << " after failed translation";
            sink_.submit({ destination, doc.original, false, output::WriteMode::Replace });
        }
        return false;
    }

    if (writes == 0)
    {
        std::string rendered = doc.document.merge();
        if (!in_place || rendered != doc.original)
            sink_.submit({ destination, std::move(rendered), backup_required, output::WriteMode::Replace });
        else
            PLOG_DEBUG << "Unchanged: " << doc.source.string();
    }
    return true;
}

} // namespace app
