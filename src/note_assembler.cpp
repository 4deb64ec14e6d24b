#include "note_assembler.hpp"
#include "timestamp.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <numeric>
#include <regex>

namespace v2n {

namespace {

const std::regex& inline_marker_regex() {
    static const std::regex pattern(R"(\[(\d{1,2}:\d{2}(?::\d{2})?)\])");
    return pattern;
}

std::string file_url(std::string path) {
    std::replace(path.begin(), path.end(), '\\', '/');
    if (!path.empty() && path.front() == '/') {
        return "file://" + path;
    }
    return "file:///" + path;
}

} // namespace

std::string NoteAssembler::make_id(size_t position, double seconds) {
    long long millis = std::llround(std::max(seconds, 0.0) * 1000.0);
    char id[64];
    std::snprintf(id, sizeof(id), "note-%03zu-%lld", position, millis);
    return id;
}

std::vector<long long> NoteAssembler::inline_references(const std::string& content) {
    std::vector<long long> references;
    for (auto it = std::sregex_iterator(content.begin(), content.end(), inline_marker_regex());
         it != std::sregex_iterator(); ++it) {
        auto seconds = parse_timestamp((*it)[1].str());
        if (seconds) {
            references.push_back(static_cast<long long>(std::floor(*seconds)));
        }
    }
    return references;
}

std::string NoteAssembler::embed_inline_images(const std::string& content, const InlineImageMap& inline_images) {
    if (inline_images.empty()) {
        return content;
    }

    std::string result;
    auto last = content.cbegin();
    for (auto it = std::sregex_iterator(content.begin(), content.end(), inline_marker_regex());
         it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        result.append(last, match[0].first);
        last = match[0].second;

        auto seconds = parse_timestamp(match[1].str());
        auto image = seconds ? inline_images.find(static_cast<long long>(std::floor(*seconds)))
                             : inline_images.end();
        if (image == inline_images.end() || image->second.empty()) {
            result.append(match[0].first, match[0].second);
            continue;
        }
        result += "\n\n![" + format_timestamp(*seconds) + "](" + file_url(image->second) + ")\n\n";
    }
    result.append(last, content.cend());
    return result;
}

std::vector<NoteNode> NoteAssembler::assemble(const std::vector<Moment>& moments,
                                              const std::vector<FrameResult>& frames,
                                              const InlineImageMap& inline_images) {
    std::vector<size_t> order(moments.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&moments](size_t a, size_t b) {
        return moments[a].seconds < moments[b].seconds;
    });

    std::vector<NoteNode> notes;
    notes.reserve(moments.size());
    for (size_t position = 0; position < order.size(); ++position) {
        size_t moment_index = order[position];
        const Moment& moment = moments[moment_index];

        NoteNode note;
        note.id = make_id(position, moment.seconds);
        note.timestamp = format_timestamp(moment.seconds);
        note.seconds = moment.seconds;
        note.title = moment.title;
        note.content = embed_inline_images(moment.content, inline_images);
        note.edited = false;

        if (moment_index < frames.size()) {
            if (const auto* success = std::get_if<FrameSuccess>(&frames[moment_index])) {
                note.image_path = success->path;
            }
        }
        notes.push_back(std::move(note));
    }
    return notes;
}

} // namespace v2n
