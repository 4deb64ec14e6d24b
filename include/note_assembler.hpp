#pragma once

#include "note_types.hpp"
#include <map>
#include <string>
#include <vector>

namespace v2n {

// Image for an inline "[MM:SS]" marker, keyed by whole seconds
using InlineImageMap = std::map<long long, std::string>;

class NoteAssembler {
public:
    // Pairs moments[i] with frames[i]; output is sorted by seconds with
    // position-derived ids. Missing frame results count as failures.
    static std::vector<NoteNode> assemble(const std::vector<Moment>& moments,
                                          const std::vector<FrameResult>& frames,
                                          const InlineImageMap& inline_images = {});

    static std::string make_id(size_t position, double seconds);

    // Whole-second times of "[MM:SS]" / "[HH:MM:SS]" markers, in order of appearance
    static std::vector<long long> inline_references(const std::string& content);

    // Replaces resolved markers with markdown images; unresolved markers stay as written
    static std::string embed_inline_images(const std::string& content, const InlineImageMap& inline_images);
};

} // namespace v2n
