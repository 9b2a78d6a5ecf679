#ifndef STITCHTYPES_H
#define STITCHTYPES_H

#include <QImage>
#include <QString>
#include <QVector>

struct StitchOptions {
    bool useCircularMask = true;    // Round display: corners outside the inscribed circle are absent
    bool useTransparency = false;   // Fill uncovered top/bottom corners with (0,0,0,0)
};

enum class StitchError {
    None,
    InputError,         // No frames, a null frame, or differing widths
    AllocationError     // Frames were valid but the output canvas could not be allocated
};

enum class StitchWarningKind {
    DegenerateHash,     // Sampling band is empty, every row hashes to the seed
    CompositingGap      // Output row had no usable sample and was left transparent
};

struct StitchWarning {
    StitchWarningKind kind = StitchWarningKind::DegenerateHash;
    int frameIndex = -1;
    int row = -1;
    QString message;
};

// Placement of one frame relative to its predecessor and to frame 0.
struct FrameAlignment {
    int frameIndex = 0;
    int offset = 0;             // Shift against frame (frameIndex - 1); 0 for frame 0
    int absoluteOffset = 0;     // Output row of this frame's row 0
    int score = 0;              // Matching rows at the chosen offset; 0 for frame 0
};

struct StitchResult {
    bool success = false;
    QImage canvas;              // Format_ARGB32
    QVector<FrameAlignment> alignments;
    QVector<StitchWarning> warnings;
    StitchError error = StitchError::None;
    QString errorMessage;
};

#endif // STITCHTYPES_H
