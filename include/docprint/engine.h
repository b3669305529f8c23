#pragma once

#include "docprint/config.h"
#include "docprint/document.h"
#include "docprint/errors.h"
#include "docprint/page.h"
#include <optional>
#include <ostream>

namespace docprint {

/// Outcome of a render. Exactly one of `artifact` and `error` is set.
struct RenderResult {
    std::optional<OutputArtifact> artifact;
    std::optional<RenderError> error;

    bool ok() const { return artifact.has_value(); }
};

/// Lay out `tree` onto pages of `config`.
/// Configuration and document shape are validated before anything is
/// drawn; on failure no artifact is produced.
RenderResult render(const DocumentTree& tree,
                    const PageConfig& config,
                    const RenderOptions& options = {});

/// Serialize an artifact as a PDF file
void writePdf(const OutputArtifact& artifact, std::ostream& out,
              const std::string& title = "");

/// Render and write the PDF in one step. On error nothing is written to
/// `out` and the error is returned in the result.
RenderResult exportPdf(const DocumentTree& tree,
                       const PageConfig& config,
                       const RenderOptions& options,
                       std::ostream& out);

} // namespace docprint
