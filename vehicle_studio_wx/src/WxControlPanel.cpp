#include "WxControlPanel.hpp"
#include <wx/filedlg.h>
#include <wx/dirdlg.h>
#include <wx/sizer.h>
#include <wx/statline.h>
#include <wx/filename.h>

// Define custom events
wxDEFINE_EVENT(wxEVT_STUDIO_SETTINGS_CHANGED, wxCommandEvent);
wxDEFINE_EVENT(wxEVT_STUDIO_PROCESS_REQUESTED, wxCommandEvent);
wxDEFINE_EVENT(wxEVT_STUDIO_BATCH_ITEM_SELECTED, wxCommandEvent);

// Cutouts need an alpha channel, so only formats that carry one are offered.
static bool IsCutoutPath(const wxString& p)
{
    wxFileName fn(p);
    wxString ext = fn.GetExt().Lower();
    return ext == "png" || ext == "webp" || ext == "tif" || ext == "tiff";
}

bool WxFileDropTarget::OnDropFiles(wxCoord, wxCoord, const wxArrayString& filenames)
{
    wxArrayString imgs;
    for (auto& f : filenames) if (IsCutoutPath(f)) imgs.Add(f);
    if (!imgs.IsEmpty())
    {
        owner_->AddFiles(imgs);
        return true;
    }
    return false;
}

WxControlPanel::WxControlPanel(wxWindow* parent, const std::vector<std::string>& backdropIds) : wxPanel(parent)
{
    BuildUI(backdropIds);
    WireEvents();
}

void WxControlPanel::BuildUI(const std::vector<std::string>& backdropIds)
{
    auto* root = new wxBoxSizer(wxVERTICAL);

    // Section: Batch list + buttons
    root->Add(new wxStaticText(this, wxID_ANY, "Cutouts (PNG with alpha)"), 0, wxALL, 6);
    list_ = new wxListBox(this, wxID_ANY);
    list_->SetMinSize(wxSize(280, 200));
    list_->SetDropTarget(new WxFileDropTarget(this));
    root->Add(list_, 1, wxEXPAND | wxLEFT | wxRIGHT, 6);

    auto* btnRow = new wxBoxSizer(wxHORIZONTAL);
    addBtn_ = new wxButton(this, wxID_ANY, "Add Cutouts...");
    clearBtn_ = new wxButton(this, wxID_ANY, "Clear");
    btnRow->Add(addBtn_, 0, wxRIGHT, 6);
    btnRow->Add(clearBtn_, 0);
    root->Add(btnRow, 0, wxALL, 6);

    root->Add(new wxStaticLine(this), 0, wxEXPAND | wxALL, 6);

    // Section: Backdrop and placement
    auto* placeBox = new wxStaticBoxSizer(wxVERTICAL, this, "Backdrop & Placement");
    auto* bdRow = new wxBoxSizer(wxHORIZONTAL);
    bdRow->Add(new wxStaticText(this, wxID_ANY, "Backdrop:"), 0, wxALIGN_CENTER_VERTICAL | wxRIGHT, 4);
    backdropBox_ = new wxComboBox(this, wxID_ANY, wxEmptyString, wxDefaultPosition, wxDefaultSize, 0, nullptr, wxCB_READONLY);
    for (const auto& id : backdropIds) backdropBox_->Append(wxString::FromUTF8(id.c_str()));
    int white = backdropBox_->FindString("studio_white");
    backdropBox_->SetSelection(white != wxNOT_FOUND ? white : 0);
    bdRow->Add(backdropBox_, 1);
    placeBox->Add(bdRow, 0, wxEXPAND | wxALL, 6);

    auto* orRow = new wxBoxSizer(wxHORIZONTAL);
    orRow->Add(new wxStaticText(this, wxID_ANY, "Orientation:"), 0, wxALIGN_CENTER_VERTICAL | wxRIGHT, 4);
    orientationBox_ = new wxComboBox(this, wxID_ANY, wxEmptyString, wxDefaultPosition, wxDefaultSize, 0, nullptr, wxCB_READONLY);
    orientationBox_->Append("Auto (from aspect ratio)");
    orientationBox_->Append("Side");
    orientationBox_->Append("Front / back");
    orientationBox_->Append("Three-quarter");
    orientationBox_->SetSelection(0);
    orRow->Add(orientationBox_, 1);
    placeBox->Add(orRow, 0, wxEXPAND | wxALL, 6);

    auto* scaleRow = new wxBoxSizer(wxHORIZONTAL);
    scaleOverride_ = new wxCheckBox(this, wxID_ANY, "Scale:");
    scale_ = new wxSpinCtrlDouble(this, wxID_ANY);
    scale_->SetRange(0.01, 2.0);
    scale_->SetIncrement(0.01);
    scale_->SetDigits(2);
    scale_->SetValue(0.38);
    scaleRow->Add(scaleOverride_, 0, wxALIGN_CENTER_VERTICAL | wxRIGHT, 4);
    scaleRow->Add(scale_, 0, wxRIGHT, 12);
    placeBox->Add(scaleRow, 0, wxALL, 6);

    auto* anchorRow = new wxBoxSizer(wxHORIZONTAL);
    anchorOverride_ = new wxCheckBox(this, wxID_ANY, "Anchor x/y:");
    anchorX_ = new wxSpinCtrlDouble(this, wxID_ANY);
    anchorY_ = new wxSpinCtrlDouble(this, wxID_ANY);
    for (auto* s : { anchorX_, anchorY_ }) { s->SetRange(0.0, 1.0); s->SetIncrement(0.01); s->SetDigits(2); }
    anchorX_->SetValue(0.5);
    anchorY_->SetValue(0.85);
    anchorRow->Add(anchorOverride_, 0, wxALIGN_CENTER_VERTICAL | wxRIGHT, 4);
    anchorRow->Add(anchorX_, 0, wxRIGHT, 6);
    anchorRow->Add(anchorY_, 0);
    placeBox->Add(anchorRow, 0, wxALL, 6);

    auto* fxRow = new wxBoxSizer(wxHORIZONTAL);
    shadow_ = new wxCheckBox(this, wxID_ANY, "Shadow");
    shadow_->SetValue(true);
    reflection_ = new wxCheckBox(this, wxID_ANY, "Reflection");
    fxRow->Add(shadow_, 0, wxRIGHT, 12);
    fxRow->Add(reflection_, 0);
    placeBox->Add(fxRow, 0, wxALL, 6);
    root->Add(placeBox, 0, wxEXPAND | wxLEFT | wxRIGHT, 6);

    // Section: Plate redaction
    auto* plateBox = new wxStaticBoxSizer(wxVERTICAL, this, "Plate Redaction");
    plateEnabled_ = new wxCheckBox(this, wxID_ANY, "Mask region (final image pixels)");
    plateBox->Add(plateEnabled_, 0, wxALL, 6);
    auto* plateRow = new wxBoxSizer(wxHORIZONTAL);
    auto addCoord = [&](const wxString& label, wxSpinCtrl*& ctrl) {
        plateRow->Add(new wxStaticText(this, wxID_ANY, label), 0, wxALIGN_CENTER_VERTICAL | wxRIGHT, 4);
        ctrl = new wxSpinCtrl(this, wxID_ANY, wxEmptyString, wxDefaultPosition, wxSize(80, -1), wxSP_ARROW_KEYS, 0, 20000, 0);
        plateRow->Add(ctrl, 0, wxRIGHT, 8);
    };
    addCoord("x0:", plateX0_);
    addCoord("y0:", plateY0_);
    addCoord("x1:", plateX1_);
    addCoord("y1:", plateY1_);
    plateBox->Add(plateRow, 0, wxALL, 6);
    auto* methodRow = new wxBoxSizer(wxHORIZONTAL);
    methodRow->Add(new wxStaticText(this, wxID_ANY, "Method:"), 0, wxALIGN_CENTER_VERTICAL | wxRIGHT, 4);
    maskMethodBox_ = new wxComboBox(this, wxID_ANY, wxEmptyString, wxDefaultPosition, wxDefaultSize, 0, nullptr, wxCB_READONLY);
    maskMethodBox_->Append("Pixelate");
    maskMethodBox_->Append("Blur");
    maskMethodBox_->SetSelection(0);
    methodRow->Add(maskMethodBox_, 0, wxRIGHT, 12);
    methodRow->Add(new wxStaticText(this, wxID_ANY, "Cell px:"), 0, wxALIGN_CENTER_VERTICAL | wxRIGHT, 4);
    maskCell_ = new wxSpinCtrl(this, wxID_ANY, wxEmptyString, wxDefaultPosition, wxSize(70, -1), wxSP_ARROW_KEYS, kMinMaskCellSize, 128, 16);
    methodRow->Add(maskCell_, 0);
    plateBox->Add(methodRow, 0, wxALL, 6);
    root->Add(plateBox, 0, wxEXPAND | wxLEFT | wxRIGHT, 6);

    // Section: Processing
    auto* paramsBox = new wxStaticBoxSizer(wxVERTICAL, this, "Processing");
    auto* paramsRow = new wxBoxSizer(wxHORIZONTAL);
    paramsRow->Add(new wxStaticText(this, wxID_ANY, "Alpha threshold:"), 0, wxALIGN_CENTER_VERTICAL | wxRIGHT, 4);
    alphaThr_ = new wxSpinCtrl(this, wxID_ANY, wxEmptyString, wxDefaultPosition, wxSize(80, -1), wxSP_ARROW_KEYS, 0, 254, AnalyzerSettings{}.alphaThreshold);
    paramsRow->Add(alphaThr_, 0, wxRIGHT, 12);
    processBtn_ = new wxButton(this, wxID_ANY, "Process Cutouts");
    processBtn_->Enable(false);
    paramsRow->Add(processBtn_, 1);
    paramsBox->Add(paramsRow, 0, wxEXPAND | wxALL, 6);
    root->Add(paramsBox, 0, wxEXPAND | wxLEFT | wxRIGHT, 6);

    // Section: Output folder
    auto* outBox = new wxStaticBoxSizer(wxVERTICAL, this, "Output Folder");
    outputFolder_ = new wxTextCtrl(this, wxID_ANY);
    browseBtn_ = new wxButton(this, wxID_ANY, "Browse...");
    outBox->Add(outputFolder_, 0, wxEXPAND | wxBOTTOM, 6);
    outBox->Add(browseBtn_, 0, wxALIGN_LEFT);
    root->Add(outBox, 0, wxEXPAND | wxLEFT | wxRIGHT | wxBOTTOM, 6);

    SetSizer(root);
    UpdateOverrideControls();
}

void WxControlPanel::WireEvents()
{
    addBtn_->Bind(wxEVT_BUTTON, [this](wxCommandEvent&){
        wxFileDialog dlg(this, "Select Cutouts", wxEmptyString, wxEmptyString,
                         "Cutouts (*.png;*.webp;*.tif;*.tiff)|*.png;*.webp;*.tif;*.tiff|All files (*.*)|*.*",
                         wxFD_OPEN | wxFD_FILE_MUST_EXIST | wxFD_MULTIPLE);
        if (dlg.ShowModal() == wxID_OK)
        {
            wxArrayString paths; dlg.GetPaths(paths);
            AddFiles(paths);
        }
    });
    clearBtn_->Bind(wxEVT_BUTTON, [this](wxCommandEvent&){
        batchFiles_.Clear();
        list_->Clear();
        UpdateProcessEnabled();
    });
    list_->Bind(wxEVT_LISTBOX, [this](wxCommandEvent& ev){
        int i = ev.GetSelection();
        if (i >= 0 && i < (int)batchFiles_.size())
        {
            wxCommandEvent out(wxEVT_STUDIO_BATCH_ITEM_SELECTED);
            out.SetString(batchFiles_[i]);
            wxPostEvent(this, out);
        }
    });

    auto fireSettingsChanged = [this](wxCommandEvent&){ wxCommandEvent ev(wxEVT_STUDIO_SETTINGS_CHANGED); wxPostEvent(this, ev); };
    for (auto* box : { backdropBox_, orientationBox_, maskMethodBox_ }) box->Bind(wxEVT_COMBOBOX, fireSettingsChanged);
    for (auto* cb : { shadow_, reflection_, plateEnabled_ }) cb->Bind(wxEVT_CHECKBOX, fireSettingsChanged);
    for (auto* s : { scale_, anchorX_, anchorY_ }) s->Bind(wxEVT_SPINCTRLDOUBLE, fireSettingsChanged);
    for (auto* s : { plateX0_, plateY0_, plateX1_, plateY1_, maskCell_, alphaThr_ })
    {
        s->Bind(wxEVT_SPINCTRL, fireSettingsChanged);
        // Also react to direct text edits in spin controls
        s->Bind(wxEVT_TEXT, fireSettingsChanged);
    }
    for (auto* cb : { scaleOverride_, anchorOverride_ })
    {
        cb->Bind(wxEVT_CHECKBOX, [this](wxCommandEvent&){
            UpdateOverrideControls();
            wxCommandEvent ev(wxEVT_STUDIO_SETTINGS_CHANGED);
            wxPostEvent(this, ev);
        });
    }

    processBtn_->Bind(wxEVT_BUTTON, [this](wxCommandEvent&){ wxCommandEvent ev(wxEVT_STUDIO_PROCESS_REQUESTED); wxPostEvent(this, ev); });

    browseBtn_->Bind(wxEVT_BUTTON, [this](wxCommandEvent&){
        wxDirDialog dlg(this, "Select Output Folder", outputFolder_->GetValue());
        if (dlg.ShowModal() == wxID_OK) outputFolder_->ChangeValue(dlg.GetPath());
    });
}

void WxControlPanel::AddFiles(const wxArrayString& paths)
{
    size_t added = 0;
    for (auto& p : paths)
    {
        if (!IsCutoutPath(p)) continue;
        if (batchFiles_.Index(p) != wxNOT_FOUND) continue;
        batchFiles_.Add(p);
        list_->Append(wxFileName(p).GetFullName());
        ++added;
    }
    if (added > 0)
    {
        EnsureDefaultOutputFolder();
        UpdateProcessEnabled();
        // auto select last added
        list_->SetSelection((int)list_->GetCount()-1);
        wxCommandEvent ev(wxEVT_STUDIO_BATCH_ITEM_SELECTED); ev.SetString(batchFiles_.Last()); wxPostEvent(this, ev);
    }
}

void WxControlPanel::UpdateProcessEnabled()
{
    processBtn_->Enable(!batchFiles_.IsEmpty());
}

void WxControlPanel::UpdateOverrideControls()
{
    scale_->Enable(scaleOverride_->GetValue());
    anchorX_->Enable(anchorOverride_->GetValue());
    anchorY_->Enable(anchorOverride_->GetValue());
}

void WxControlPanel::EnsureDefaultOutputFolder()
{
    if (batchFiles_.IsEmpty() || !outputFolder_->IsEmpty()) return;
    wxFileName fn(batchFiles_[0]);
    outputFolder_->ChangeValue(fn.GetPathWithSep() + "composites");
}

PipelineRequest WxControlPanel::getRequest() const
{
    PipelineRequest r;
    r.backdropId = std::string(backdropBox_->GetValue().utf8_str());
    switch (orientationBox_->GetSelection())
    {
        case 1: r.orientationOverride = Orientation::Side; break;
        case 2: r.orientationOverride = Orientation::FrontOrBack; break;
        case 3: r.orientationOverride = Orientation::ThreeQuarter; break;
        default: break;
    }
    if (scaleOverride_->GetValue()) r.placement.scaleFactor = scale_->GetValue();
    if (anchorOverride_->GetValue())
    {
        r.placement.anchorX = anchorX_->GetValue();
        r.placement.anchorY = anchorY_->GetValue();
    }
    r.shadow = shadow_->GetValue();
    r.reflection = reflection_->GetValue();
    if (plateEnabled_->GetValue())
        r.plateRegion = BoundingBox(plateX0_->GetValue(), plateY0_->GetValue(), plateX1_->GetValue(), plateY1_->GetValue());
    r.maskMethod = maskMethodBox_->GetSelection() == 1 ? MaskMethod::Blur : MaskMethod::Pixelate;
    return r;
}

void WxControlPanel::loadRequest(const PipelineRequest& r)
{
    int bd = backdropBox_->FindString(wxString::FromUTF8(r.backdropId.c_str()));
    if (bd != wxNOT_FOUND) backdropBox_->SetSelection(bd);
    int sel = 0;
    if (r.orientationOverride)
    {
        switch (*r.orientationOverride)
        {
            case Orientation::Side: sel = 1; break;
            case Orientation::FrontOrBack: sel = 2; break;
            case Orientation::ThreeQuarter: sel = 3; break;
        }
    }
    orientationBox_->SetSelection(sel);
    scaleOverride_->SetValue(r.placement.scaleFactor.has_value());
    if (r.placement.scaleFactor) scale_->SetValue(*r.placement.scaleFactor);
    anchorOverride_->SetValue(r.placement.anchorX.has_value() || r.placement.anchorY.has_value());
    if (r.placement.anchorX) anchorX_->SetValue(*r.placement.anchorX);
    if (r.placement.anchorY) anchorY_->SetValue(*r.placement.anchorY);
    shadow_->SetValue(r.shadow);
    reflection_->SetValue(r.reflection);
    plateEnabled_->SetValue(r.plateRegion.has_value());
    if (r.plateRegion)
    {
        plateX0_->SetValue(r.plateRegion->xMin);
        plateY0_->SetValue(r.plateRegion->yMin);
        plateX1_->SetValue(r.plateRegion->xMax);
        plateY1_->SetValue(r.plateRegion->yMax);
    }
    maskMethodBox_->SetSelection(r.maskMethod == MaskMethod::Blur ? 1 : 0);
    UpdateOverrideControls();
}

PipelineSettings WxControlPanel::getSettings() const
{
    PipelineSettings s;
    s.analyzer.alphaThreshold = alphaThr_->GetValue();
    s.masker.pixelBlockSize = maskCell_->GetValue();
    s.masker.blurCellSize = maskCell_->GetValue();
    return s;
}

wxString WxControlPanel::getOutputFolder() const
{
    wxString p = outputFolder_->GetValue();
    p.Replace("\n", "");
    p.Replace("\r", "");
    p.Trim(true).Trim(false);
    return p;
}

wxArrayString WxControlPanel::getBatchFiles() const
{
    return batchFiles_;
}
