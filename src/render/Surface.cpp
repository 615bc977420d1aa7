#include "render/Surface.hpp"

namespace trellis {

const char* cursorShapeName(CursorShape shape) {
    switch (shape) {
        case CursorShape::Arrow:           return "arrow";
        case CursorShape::IBeam:           return "ibeam";
        case CursorShape::Cross:           return "cross";
        case CursorShape::PointingHand:    return "pointing_hand";
        case CursorShape::SplitVertical:   return "split_vertical";
        case CursorShape::SplitHorizontal: return "split_horizontal";
        case CursorShape::Move:            return "move";
    }
    return "arrow";
}

} // namespace trellis
