#include "fileshare/server/index_page.h"

namespace fileshare {

namespace {

const char* const INDEX_HTML = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>FileShare</title>
<style>
  body { font-family: system-ui, sans-serif; background: #eef1f6; margin: 0; padding: 24px; }
  .card { max-width: 520px; margin: 0 auto; background: #fff; border-radius: 12px;
          padding: 28px; box-shadow: 0 8px 30px rgba(0,0,0,.12); }
  h1 { margin: 0 0 20px; font-size: 24px; text-align: center; }
  .row { display: flex; justify-content: space-between; padding: 6px 0;
         border-bottom: 1px solid #f0f0f0; font-size: 14px; }
  .row span:first-child { color: #777; }
  .status { margin: 16px 0; padding: 10px; border-radius: 8px; text-align: center; font-weight: 600; }
  .waiting { background: #fff3cd; } .transferring { background: #d1ecf1; }
  .completed { background: #d4edda; } .cancelled, .error { background: #f8d7da; }
  .bar { height: 8px; background: #eee; border-radius: 4px; overflow: hidden; }
  .fill { height: 100%; width: 0; background: #4a6cf7; transition: width .2s; }
  button, .drop { width: 100%; margin-top: 12px; padding: 12px; border-radius: 8px;
                  border: none; font-size: 14px; cursor: pointer; }
  button { background: #4a6cf7; color: #fff; } button.cancel { background: #dc3545; }
  .drop { border: 2px dashed #ccc; background: #fafafa; text-align: center; box-sizing: border-box; }
  .hidden { display: none; }
  .log { margin-top: 16px; background: #1e1e1e; color: #bbb; border-radius: 8px; padding: 12px;
         font: 12px monospace; max-height: 180px; overflow-y: auto; }
  code { display: block; margin-top: 12px; background: #2d2d2d; color: #f8f8f2; padding: 8px;
         border-radius: 6px; font-size: 12px; overflow-x: auto; }
</style>
</head>
<body>
<div class="card">
  <h1>FileShare</h1>
  <div class="row"><span>Mode</span><span id="mode">-</span></div>
  <div class="row"><span>Target</span><span id="target">-</span></div>
  <div class="row"><span>Client</span><span id="client">-</span></div>
  <div class="status waiting" id="status">Waiting for connection...</div>
  <div class="bar"><div class="fill" id="fill"></div></div>
  <div id="progress-text" style="text-align:center;font-size:13px;color:#666;margin-top:6px">0%</div>
  <button id="download" class="hidden">Download</button>
  <label id="upload" class="drop hidden">Drop a file here or click to choose
    <input type="file" id="file" style="display:none">
  </label>
  <button id="cancel" class="cancel hidden">Cancel transfer</button>
  <code id="curl"></code>
  <div class="log" id="log"></div>
</div>
<script>
  const $ = (id) => document.getElementById(id);

  function formatSize(bytes) {
    if (!bytes) return '0 B';
    const units = ['B', 'KB', 'MB', 'GB'];
    const i = Math.min(Math.floor(Math.log(bytes) / Math.log(1024)), units.length - 1);
    return (bytes / Math.pow(1024, i)).toFixed(i ? 2 : 0) + ' ' + units[i];
  }

  function render(s) {
    $('mode').textContent = s.mode.toUpperCase();
    $('target').textContent = s.path + ' (' + formatSize(s.size) + ')';
    $('client').textContent = s.client_ip || 'None';
    const labels = {
      waiting: 'Waiting for connection...',
      transferring: 'Transferring... ' + s.progress.toFixed(1) + '%',
      completed: 'Transfer completed',
      cancelled: 'Transfer cancelled',
      error: 'Error: ' + (s.error || 'unknown')
    };
    $('status').className = 'status ' + s.status;
    $('status').textContent = labels[s.status] || s.status;
    $('fill').style.width = s.progress + '%';
    $('progress-text').textContent = s.progress.toFixed(1) + '% (' +
        formatSize(s.transferred) + ' / ' + formatSize(s.size) + ')';
    $('cancel').classList.toggle('hidden', s.status !== 'transferring');
  }

  async function refreshLog() {
    try {
      const lines = await (await fetch('/api/log')).json();
      $('log').innerHTML = '';
      lines.forEach((line) => {
        const div = document.createElement('div');
        div.textContent = line;
        $('log').appendChild(div);
      });
      $('log').scrollTop = $('log').scrollHeight;
    } catch (e) { console.error(e); }
  }

  function connectEvents() {
    const source = new EventSource('/api/events');
    source.onmessage = (e) => { render(JSON.parse(e.data)); refreshLog(); };
    source.onerror = () => { source.close(); setTimeout(connectEvents, 1000); };
  }

  function upload(file) {
    const form = new FormData();
    form.append('size', String(file.size));
    form.append('file', file);
    const xhr = new XMLHttpRequest();
    xhr.open('POST', '/api/upload');
    xhr.onload = () => {
      if (xhr.status === 409) {
        alert('A file named "' + file.name + '" already exists on the receiver.');
      } else if (xhr.status !== 200) {
        alert('Upload failed: ' + xhr.responseText);
      }
    };
    xhr.onerror = () => alert('Upload failed: connection lost');
    xhr.send(form);
  }

  async function init() {
    const info = await (await fetch('/api/info')).json();
    render(info);
    const origin = window.location.origin;
    if (info.mode === 'send') {
      $('download').classList.remove('hidden');
      $('curl').textContent = 'curl -O -J "' + origin + '/api/download"';
    } else {
      $('upload').classList.remove('hidden');
      $('curl').textContent = 'curl -F "file=@YOUR_FILE" "' + origin + '/api/upload"';
    }
    connectEvents();
    refreshLog();
  }

  $('download').onclick = () => { window.location.href = '/api/download'; };
  $('file').onchange = (e) => { if (e.target.files.length) upload(e.target.files[0]); };
  $('upload').ondragover = (e) => e.preventDefault();
  $('upload').ondrop = (e) => {
    e.preventDefault();
    if (e.dataTransfer.files.length) upload(e.dataTransfer.files[0]);
  };
  $('cancel').onclick = () => fetch('/api/cancel', { method: 'POST' });

  init();
</script>
</body>
</html>
)HTML";

} // anonymous namespace

const std::string& index_html() {
    static const std::string page(INDEX_HTML);
    return page;
}

} // namespace fileshare
