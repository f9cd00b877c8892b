#pragma once
#include "annotation_engine.hpp"
#include "backend.hpp"
#include "capture_engine.hpp"
#include "layout_analyzer.hpp"

namespace idelens {

class CompositeOrchestrator {
public:
  CompositeOrchestrator(IBackend &backend, LayoutAnalyzer &layouts,
                        CaptureEngine &captures);

  // Capture of one window, annotated for its role. UI elements are read
  // from the backend; a failed read leaves them empty. The capture may be
  // empty.
  SpecializedCapture capture_specialized(const Window &window);

  // Layout once, main window as the primary image, then the first window of
  // every other known role captured concurrently. Empty per-window captures
  // are logged and left out.
  CompositeCapture capture_full_ide(std::uint32_t pid = 0);

private:
  IBackend &backend_;
  LayoutAnalyzer &layouts_;
  CaptureEngine &captures_;
  AnnotationEngine annotator_;
};

} // namespace idelens
