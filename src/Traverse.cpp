/**
 * @file Traverse.cpp
 * @brief Document traversal implementation
 */

#include "treepatch/Traverse.hpp"

namespace treepatch {

namespace {

bool is_writing(TraverseMode mode) {
    return mode == TraverseMode::Add || mode == TraverseMode::Insert;
}

/**
 * @brief Outcome when the walk reaches a node that does not exist
 *
 * Only called for non-writing modes.
 */
Result missing(const TraverseOptions& options) {
    switch (options.mode) {
        case TraverseMode::Remove:
            return Result::success();
        case TraverseMode::Replace:
            if (options.silent) return Result::success();
            return Result::failure(Status::NotFound, "not found");
        default:
            return Result::failure(Status::NotFound, "not found");
    }
}

Result already_exists(const TraverseOptions& options) {
    if (options.silent) return Result::success();
    return Result::failure(Status::Unprocessable, "already exists");
}

/**
 * @brief Container to create for a missing node, chosen by the next segment
 */
Value container_for(const Segment& next) {
    return next.is_index() ? Value::array() : Value::object();
}

Result path_mismatch() {
    return Result::failure(Status::Unprocessable, "path mismatch");
}

Result too_deep() {
    return Result::failure(Status::Unprocessable,
                           "path exceeds " + std::to_string(MAX_TRAVERSAL_DEPTH) +
                           " segments");
}

} // anonymous namespace

Result read_path(const Value& document, const Path& path) {
    if (path.size() > MAX_TRAVERSAL_DEPTH) {
        return too_deep();
    }

    const Value* node = &document;
    for (const Segment& seg : path.segments()) {
        if (seg.is_key()) {
            if (node->is_null()) return Result::failure(Status::NotFound, "not found");
            if (!node->is_object()) return path_mismatch();

            auto it = node->find(seg.key());
            if (it == node->end()) {
                return Result::failure(Status::NotFound, "not found");
            }
            node = &(*it);
            continue;
        }

        if (node->is_null()) return Result::failure(Status::NotFound, "not found");
        if (!node->is_array()) return path_mismatch();

        std::size_t index = 0;
        switch (seg.selector) {
            case Segment::Selector::Append:
                return Result::failure(Status::Unprocessable, "invalid use of :+");
            case Segment::Selector::Prepend:
                return Result::failure(Status::Unprocessable, "invalid use of :*");
            case Segment::Selector::Last:
                if (node->empty()) {
                    return Result::failure(Status::NotFound, "not found");
                }
                index = node->size() - 1;
                break;
            case Segment::Selector::Position:
                index = seg.position;
                break;
        }

        if (index >= node->size()) {
            return Result::failure(Status::NotFound, "not found");
        }
        node = &(*node)[index];
    }

    return Result::success(*node);
}

Result traverse(Value& document, const Path& path, const TraverseOptions& options) {
    if (!is_canonical_fill(options.fill)) {
        return Result::failure(Status::Unprocessable, "invalid fill value");
    }

    if (options.mode == TraverseMode::Read) {
        return read_path(document, path);
    }

    if (path.size() > MAX_TRAVERSAL_DEPTH) {
        return too_deep();
    }

    const bool writing = is_writing(options.mode);
    const auto& segments = path.segments();
    Value* node = &document;

    for (std::size_t i = 0; i < segments.size(); ++i) {
        const Segment& seg = segments[i];
        const bool last_segment = (i + 1 == segments.size());

        // MAPPINGS
        if (seg.is_key()) {
            if (!node->is_object()) {
                if (!node->is_null()) return path_mismatch();
                if (!writing) return missing(options);
                *node = Value::object();
            }

            const std::string key = seg.key();
            auto it = node->find(key);
            if (it == node->end()) {
                if (!writing) return missing(options);
                if (last_segment) {
                    (*node)[key] = options.value;
                    return Result::success();
                }
                (*node)[key] = container_for(segments[i + 1]);
            } else if (last_segment) {
                if (options.mode == TraverseMode::Remove) {
                    node->erase(key);
                    return Result::success();
                }
                if (options.mode == TraverseMode::Insert) {
                    return already_exists(options);
                }
            }

            node = &(*node)[key];
            continue;
        }

        // SEQUENCES
        if (!node->is_array()) {
            if (!node->is_null()) return path_mismatch();
            if (!writing) return missing(options);
            *node = Value::array();
        }

        std::size_t index = 0;
        bool prepended = false;
        bool resolved = true;
        switch (seg.selector) {
            case Segment::Selector::Last:
                // last of an empty sequence does not exist
                if (node->empty()) {
                    resolved = false;
                } else {
                    index = node->size() - 1;
                }
                break;

            case Segment::Selector::Append:
                if (!writing) {
                    return Result::failure(Status::Unprocessable, "invalid use of :+");
                }
                index = node->size();
                break;

            case Segment::Selector::Prepend:
                if (!writing) {
                    return Result::failure(Status::Unprocessable, "invalid use of :*");
                }
                // the fill slot may be overwritten below, or it may stay
                node->insert(node->begin(), options.fill);
                index = 0;
                prepended = true;
                break;

            case Segment::Selector::Position:
                index = seg.position;
                break;
        }

        if (writing && resolved) {
            while (node->size() < index) {
                node->push_back(options.fill);
            }
        }

        if (!resolved || index >= node->size()) {
            if (!writing) return missing(options);
            if (last_segment) {
                node->push_back(options.value);
                return Result::success();
            }
            node->push_back(container_for(segments[i + 1]));
            index = node->size() - 1;
        } else if (last_segment) {
            if (options.mode == TraverseMode::Remove) {
                node->erase(index);
                return Result::success();
            }
            if (options.mode == TraverseMode::Insert && !prepended) {
                return already_exists(options);
            }
        }

        node = &(*node)[index];
    }

    if (options.mode == TraverseMode::Remove) {
        return Result::failure(Status::BadRequest, "nothing to remove");
    }

    *node = options.value;
    return Result::success(*node);
}

} // namespace treepatch
