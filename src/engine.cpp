#include "docprint/engine.h"
#include "docprint/block_renderer.h"
#include "docprint/emitter.h"
#include "docprint/log.h"
#include "docprint/paginator.h"
#include "docprint/pdf_writer.h"

namespace docprint {

namespace {

const MetricProvider& metricsFor(const RenderOptions& options) {
    static const StandardFontMetrics kStandardMetrics{};
    if (options.metrics) return *options.metrics;
    return kStandardMetrics;
}

RenderResult failure(RenderErrorKind kind, const char* what) {
    RenderResult result;
    result.error = RenderError{kind, what};
    return result;
}

} // anonymous namespace

RenderResult render(const DocumentTree& tree,
                    const PageConfig& config,
                    const RenderOptions& options) {
    DP_LOGI("render: blocks=%zu page=%.1fx%.1f margin=%.1f spacing=%.2f",
            tree.blocks.size(), config.pageWidthMm, config.pageHeightMm,
            config.marginMm, config.lineSpacingMultiplier);

    try {
        validatePageConfig(config);
        if (!(options.baseFontSizePt > 0)) {
            throw ConfigurationError("base font size must be positive");
        }
        validateDocument(tree);

        const MetricProvider& metrics = metricsFor(options);
        ArtifactRecorder recorder;
        Paginator paginator(config, recorder);
        paginator.start();

        BlockRenderer renderer(metrics, config, options, recorder);
        if (!options.title.empty()) {
            renderer.renderTitle(options.title, paginator);
        }
        renderer.renderBlocks(tree.blocks, BlockContext{}, paginator);
        recorder.finish();

        RenderResult result;
        result.artifact = recorder.release();
        DP_LOGI("render: pages=%zu", result.artifact->pages.size());
        return result;
    } catch (const ConfigurationError& e) {
        DP_LOGW("render: configuration error: %s", e.what());
        return failure(RenderErrorKind::Configuration, e.what());
    } catch (const InvalidDocumentError& e) {
        DP_LOGW("render: invalid document: %s", e.what());
        return failure(RenderErrorKind::InvalidDocument, e.what());
    }
}

void writePdf(const OutputArtifact& artifact, std::ostream& out, const std::string& title) {
    PdfWriter writer(out, title);
    replay(artifact, writer);
}

RenderResult exportPdf(const DocumentTree& tree,
                       const PageConfig& config,
                       const RenderOptions& options,
                       std::ostream& out) {
    RenderResult result = render(tree, config, options);
    if (result.ok()) {
        writePdf(*result.artifact, out, options.title);
    }
    return result;
}

} // namespace docprint
