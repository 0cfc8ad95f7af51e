#include "mnemobox/sandbox/runtime_bootstrap.hpp"

#include "mnemobox/common/json_util.hpp"

#include <algorithm>

namespace mnemobox::sandbox {

namespace {

constexpr std::uint64_t kMinimumHeapMegabytes = 8;

// Host script. Runs with the permission model on: no file, child process,
// worker or addon grants. The snippet only sees what the prelude installs on
// the context global, and the prelude only reaches the host through
// string-in/string-out functions.
constexpr const char *kHostScript = R"JS(const vm = require('vm');
const fs = require('fs');
const { StringDecoder } = require('string_decoder');

const REQUEST_FD = 3;
const REPLY_FD = 4;
const hostProcess = process;
const exit = hostProcess.exit.bind(hostProcess);

for (const name of ['binding', '_linkedBinding', 'dlopen', 'kill', '_kill', 'chdir', 'setuid',
                    'setgid', 'seteuid', 'setegid', 'setgroups', 'initgroups', 'umask',
                    'openStdin', 'abort']) {
  try {
    hostProcess[name] = undefined;
  } catch (_) {
    // Non-writable members stay as they are.
  }
}

function writeAll(fd, text) {
  const data = Buffer.from(text, 'utf8');
  let offset = 0;
  while (offset < data.length) {
    offset += fs.writeSync(fd, data, offset, data.length - offset);
  }
}

const decoder = new StringDecoder('utf8');
const chunk = Buffer.alloc(65536);
let pending = '';

function readLine() {
  let newline = pending.indexOf('\n');
  while (newline < 0) {
    const n = fs.readSync(REPLY_FD, chunk, 0, chunk.length, null);
    if (n === 0) {
      return '{"ok":false,"error":"broker closed"}';
    }
    pending += decoder.write(chunk.subarray(0, n));
    newline = pending.indexOf('\n');
  }
  const line = pending.slice(0, newline);
  pending = pending.slice(newline + 1);
  return line;
}

let finished = false;
function finish(message) {
  if (finished) {
    return;
  }
  finished = true;
  writeAll(REQUEST_FD, JSON.stringify(Object.assign({ op: 'result' }, message)) + '\n');
  exit(0);
}

const brokerCall = (request) => {
  writeAll(REQUEST_FD, String(request) + '\n');
  return readLine();
};
const emit = (fd, text) => {
  writeAll(fd === 2 ? 2 : 1, String(text) + '\n');
};

const PRELUDE = `(function (brokerCall, emit, payloadJson) {
  'use strict';
  const payload = JSON.parse(payloadJson);
  let nextId = 1;
  const call = (op, fields) => {
    const reply = JSON.parse(brokerCall(JSON.stringify(Object.assign({ id: nextId++, op }, fields))));
    if (!reply.ok) {
      throw new Error(String(reply.error));
    }
    return reply;
  };
  const show = (value) => {
    if (typeof value === 'string') {
      return value;
    }
    try {
      const text = JSON.stringify(value);
      return text === undefined ? String(value) : text;
    } catch (_) {
      return String(value);
    }
  };
  const line = (args) => Array.prototype.map.call(args, show).join(' ');
  globalThis.console = Object.freeze({
    log: (...args) => emit(1, line(args)),
    info: (...args) => emit(1, line(args)),
    warn: (...args) => emit(2, line(args)),
    error: (...args) => emit(2, line(args)),
  });
  globalThis.sandbox = Object.freeze({
    readText: (path) => call('fs.read', { path: String(path) }).value,
    writeText: (path, text) => { call('fs.write', { path: String(path), data: String(text) }); },
    remove: (path) => { call('fs.delete', { path: String(path) }); },
    request: (url, options) => {
      const opts = options || {};
      const reply = call('net.request', {
        url: String(url),
        method: String(opts.method || 'GET'),
        body: opts.body === undefined ? '' : String(opts.body),
      });
      return Object.freeze({ status: reply.status, body: reply.value });
    },
    queryMemory: (query) => JSON.parse(call('memory.query', { query: String(query) }).value),
    process: Object.freeze(payload.process),
  });
  let input = null;
  let inputError = null;
  try {
    input = JSON.parse(payload.input);
  } catch (err) {
    inputError = 'context input is not valid JSON: ' + err.message;
  }
  globalThis.context = Object.freeze({
    task: payload.task,
    input,
    metadata: Object.freeze(payload.metadata),
  });
  return Object.freeze({
    inputError,
    render: (value) => {
      const text = value === undefined ? undefined : JSON.stringify(value);
      return text === undefined ? '' : text;
    },
    describe: (err) => {
      if (err !== null && typeof err === 'object') {
        return [String(err.name || 'Error'), String(err.message), String(err.stack || '')];
      }
      return ['Error', String(err), ''];
    },
  });
})`;

const payloadJson = JSON.stringify({
  task: PAYLOAD.task,
  input: PAYLOAD.input,
  metadata: PAYLOAD.metadata,
  process: {
    pid: hostProcess.pid,
    platform: hostProcess.platform,
    arch: hostProcess.arch,
    version: hostProcess.version,
    uptime: hostProcess.uptime(),
  },
});

const sandboxContext = vm.createContext(Object.create(null), {
  name: 'snippet',
  codeGeneration: { strings: false, wasm: false },
});
const helpers = new vm.Script(PRELUDE, { filename: 'prelude.js' })
  .runInContext(sandboxContext)(brokerCall, emit, payloadJson);

const fail = (kind, err) => {
  const [name, message, stack] = helpers.describe(err);
  finish({ status: 'error', kind, message: name + ': ' + message, stack });
};

hostProcess.on('unhandledRejection', (reason) => fail('runtime', reason));

if (helpers.inputError !== null) {
  finish({ status: 'error', kind: 'runtime', message: helpers.inputError });
}

let script;
try {
  script = new vm.Script('(async () => {\n' + PAYLOAD.code + '\n})()', {
    filename: 'snippet.js',
    lineOffset: -1,
  });
} catch (err) {
  finish({ status: 'error', kind: 'syntax', message: String(err.name) + ': ' + String(err.message) });
}

Promise.resolve()
  .then(() => script.runInContext(sandboxContext))
  .then(
    (value) => {
      let output;
      try {
        output = helpers.render(value);
      } catch (err) {
        fail('runtime', err);
        return;
      }
      finish({ status: 'ok', output });
    },
    (err) => fail('runtime', err));
)JS";

} // namespace

std::string build_runtime_program(const std::string &code, const ExecutionContext &context) {
  std::string program;
  program.reserve(code.size() + context.input.size() + 8192);
  program += "'use strict';\nconst PAYLOAD = {\"code\":";
  program += common::json_quote(code);
  program += ",\"task\":";
  program += common::json_quote(context.task);
  program += ",\"input\":";
  program += common::json_quote(context.input);
  program += ",\"metadata\":";
  program += common::json_object(context.metadata);
  program += "};\n";
  program += kHostScript;
  return program;
}

std::uint64_t runtime_heap_megabytes(const PolicyConfig &policy) {
  constexpr std::uint64_t MIB = 1024ULL * 1024ULL;
  const std::uint64_t bytes = policy.limits().max_memory_bytes;
  return std::max(kMinimumHeapMegabytes, (bytes + MIB - 1) / MIB);
}

std::vector<std::string> runtime_flags(const PolicyConfig &policy) {
  return {
      "--no-warnings",
      "--experimental-permission",
      "--disallow-code-generation-from-strings",
      "--max-old-space-size=" + std::to_string(runtime_heap_megabytes(policy)),
      "-",
  };
}

} // namespace mnemobox::sandbox
