#pragma once
#include <wx/wx.h>
#include <wx/scrolwin.h>
#include <wx/statbmp.h>
#include <wx/timer.h>
#include <opencv2/core.hpp>

#include "pipeline/composite_pipeline.hpp"

class WxPreviewPanel : public wxPanel
{
public:
    explicit WxPreviewPanel(wxWindow* parent);

    // Runs the pipeline in memory on imagePath and shows cutout and composite side by side.
    void UpdatePreview(const wxString& imagePath, const CompositePipeline& pipeline, const PipelineRequest& request);
    void ClearPreview();
    void SetStatus(const wxString& message, bool isError = false);
    wxString CurrentImagePath() const { return currentImagePath_; }

private:
    void BuildUI();
    void LayoutImages();
    void ShowOverlay(const wxString& text, const wxColour& color, int durationMs = 1200);
    void OnSize(wxSizeEvent&);

    wxScrolledWindow* scroll_ {nullptr};
    wxStaticText* originalTitle_ {nullptr};
    wxStaticBitmap* originalBmp_ {nullptr};
    wxStaticText* resultTitle_ {nullptr};
    wxStaticBitmap* resultBmp_ {nullptr};
    wxStaticText* overlay_ {nullptr};
    wxTimer overlayHideTimer_;

    // Full-resolution BGR images kept for display rescaling
    cv::Mat originalMat_;
    cv::Mat resultMat_;
    wxString currentImagePath_;

    wxDECLARE_EVENT_TABLE();
};
