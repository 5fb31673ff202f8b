#pragma once
#include <wx/wx.h>
#include <wx/spinctrl.h>
#include <wx/listbox.h>
#include <wx/combobox.h>
#include <wx/stattext.h>
#include <wx/dnd.h>
#include <string>
#include <vector>

#include "models/PipelineSettings.hpp"
#include "pipeline/composite_pipeline.hpp"

// Custom event declarations
wxDECLARE_EVENT(wxEVT_STUDIO_SETTINGS_CHANGED, wxCommandEvent);
wxDECLARE_EVENT(wxEVT_STUDIO_PROCESS_REQUESTED, wxCommandEvent);
wxDECLARE_EVENT(wxEVT_STUDIO_BATCH_ITEM_SELECTED, wxCommandEvent);

class WxFileDropTarget;

class WxControlPanel : public wxPanel
{
public:
    WxControlPanel(wxWindow* parent, const std::vector<std::string>& backdropIds);

    PipelineRequest getRequest() const;
    void loadRequest(const PipelineRequest& request);
    PipelineSettings getSettings() const;
    wxString getOutputFolder() const;
    wxArrayString getBatchFiles() const;

private:
    void BuildUI(const std::vector<std::string>& backdropIds);
    void WireEvents();
    void AddFiles(const wxArrayString& paths);
    void UpdateProcessEnabled();
    void UpdateOverrideControls();
    void EnsureDefaultOutputFolder();

    // Controls
    wxListBox* list_ {nullptr};
    wxButton* addBtn_ {nullptr};
    wxButton* clearBtn_ {nullptr};

    wxComboBox* backdropBox_ {nullptr};
    wxComboBox* orientationBox_ {nullptr};
    wxCheckBox* scaleOverride_ {nullptr};
    wxSpinCtrlDouble* scale_ {nullptr};
    wxCheckBox* anchorOverride_ {nullptr};
    wxSpinCtrlDouble* anchorX_ {nullptr};
    wxSpinCtrlDouble* anchorY_ {nullptr};
    wxCheckBox* shadow_ {nullptr};
    wxCheckBox* reflection_ {nullptr};

    wxCheckBox* plateEnabled_ {nullptr};
    wxSpinCtrl* plateX0_ {nullptr};
    wxSpinCtrl* plateY0_ {nullptr};
    wxSpinCtrl* plateX1_ {nullptr};
    wxSpinCtrl* plateY1_ {nullptr};
    wxComboBox* maskMethodBox_ {nullptr};
    wxSpinCtrl* maskCell_ {nullptr};

    wxSpinCtrl* alphaThr_ {nullptr};
    wxButton* processBtn_ {nullptr};

    wxTextCtrl* outputFolder_ {nullptr};
    wxButton* browseBtn_ {nullptr};

    // Data: keep full paths separate from displayed basenames
    wxArrayString batchFiles_;

    friend class WxFileDropTarget;
};

class WxFileDropTarget : public wxFileDropTarget
{
public:
    explicit WxFileDropTarget(WxControlPanel* owner) : owner_(owner) {}
    bool OnDropFiles(wxCoord, wxCoord, const wxArrayString& filenames) override;
private:
    WxControlPanel* owner_;
};
