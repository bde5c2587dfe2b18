#include "extract/tag_extractor.hpp"

#include "extract/raw_string_extractor.hpp"
#include "extract/tagged_template_extractor.hpp"

namespace embedql::extract {

auto make_tag_extractor(std::string_view name) -> Rc<TagExtractor> {
    if (name == "javascript" || name == "js" || name == "typescript") {
        return make_rc<TaggedTemplateExtractor>();
    }
    if (name == "cpp" || name == "c++") {
        return make_rc<RawStringExtractor>();
    }
    return nullptr;
}

} // namespace embedql::extract
