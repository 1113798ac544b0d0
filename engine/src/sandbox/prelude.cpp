#include "sandbox/prelude.h"

namespace scriptbox {

namespace {

constexpr const char* kContextPrelude = R"JS(
(function (host) {
  'use strict';

  const formatArg = (value) => {
    if (typeof value === 'string') return value;
    if (value instanceof Error) return `${value.name}: ${value.message}`;
    try {
      const text = JSON.stringify(value);
      return text === undefined ? String(value) : text;
    } catch (e) {
      return String(value);
    }
  };
  const formatArgs = (args) => args.map(formatArg).join(' ');

  const console = {
    log: (...args) => host.log('info', formatArgs(args)),
    info: (...args) => host.log('info', formatArgs(args)),
    debug: (...args) => host.log('debug', formatArgs(args)),
    warn: (...args) => host.log('warn', formatArgs(args)),
    error: (...args) => host.log('error', formatArgs(args)),
  };

  class TextEncoder {
    get encoding() { return 'utf-8'; }
    encode(input = '') { return host.utf8Encode(String(input)); }
  }

  class TextDecoder {
    constructor(label = 'utf-8') {
      const normalized = String(label).trim().toLowerCase();
      if (normalized !== 'utf-8' && normalized !== 'utf8') {
        throw new RangeError(`The encoding label provided ('${label}') is invalid.`);
      }
    }
    get encoding() { return 'utf-8'; }
    decode(input) {
      if (input === undefined || input === null) return '';
      return host.utf8Decode(input);
    }
  }

  const define = (name, value) => Object.defineProperty(globalThis, name, {
    value, writable: true, configurable: true, enumerable: false,
  });
  define('console', Object.freeze(console));
  define('TextEncoder', TextEncoder);
  define('TextDecoder', TextDecoder);

  const deepFreeze = (value) => {
    if (value && typeof value === 'object' && !Object.isFrozen(value)) {
      Object.freeze(value);
      for (const key of Object.getOwnPropertyNames(value)) deepFreeze(value[key]);
    }
    return value;
  };

  const mapping = host.fileMap;

  const ctx = {
    inputs: host.inputs,
    paths: host.paths,
    env: host.env,
    files: {
      read: async (name) => host.readFile(String(name)),
      write: async (name, data) => host.writeFile(String(name), data),
      exists: (name) => host.exists(String(name)),
      getPath: (name) => host.getPath(String(name)),
      listMapped: () => Object.keys(mapping),
      getMapping: () => Object.assign({}, mapping),
      createOutputPath: (name) => host.createOutputPath(String(name)),
    },
    excel: {
      MIME_TYPES: host.mimeTypes,
      generateOutputName: (base, ext = 'xlsx') => host.generateOutputName(String(base), String(ext)),
      getFileType: (name) => host.getFileType(String(name)),
    },
    log: {
      info: (...args) => host.log('info', formatArgs(args)),
      warn: (...args) => host.log('warn', formatArgs(args)),
      error: (...args) => host.log('error', formatArgs(args)),
    },
  };

  deepFreeze(mapping);
  return deepFreeze(ctx);
})
)JS";

constexpr const char* kExcelJsModule = R"JS(
import { encode, decode } from 'host:xlsx';

const columnLetters = (n) => {
  let s = '';
  while (n > 0) {
    const r = (n - 1) % 26;
    s = String.fromCharCode(65 + r) + s;
    n = Math.floor((n - 1) / 26);
  }
  return s;
};

const lettersToNumber = (letters) => {
  let n = 0;
  for (const ch of letters.toUpperCase()) n = n * 26 + (ch.charCodeAt(0) - 64);
  return n;
};

const parseAddress = (ref) => {
  const m = /^\$?([A-Za-z]{1,3})\$?(\d+)$/.exec(String(ref));
  if (!m) throw new Error(`Invalid cell address: ${ref}`);
  return { col: lettersToNumber(m[1]), row: parseInt(m[2], 10) };
};

const argbOf = (color) => {
  if (!color) return undefined;
  if (typeof color === 'string') return color;
  return color.argb ? String(color.argb) : undefined;
};

// Cell value -> codec cell (null when there is nothing to store)
const encodeValue = (value) => {
  if (value === null || value === undefined) return null;
  if (typeof value === 'string') return { type: 'string', value };
  if (typeof value === 'number') {
    return Number.isFinite(value) ? { type: 'number', value } : { type: 'string', value: String(value) };
  }
  if (typeof value === 'boolean') return { type: 'boolean', value };
  if (value instanceof Date) return { type: 'string', value: value.toISOString() };
  if (typeof value === 'object') {
    if (typeof value.formula === 'string' || typeof value.sharedFormula === 'string') {
      const cell = { type: 'formula', formula: value.formula || value.sharedFormula };
      let result = value.result;
      if (result instanceof Date) result = result.toISOString();
      if (result !== undefined && result !== null && typeof result !== 'object') cell.result = result;
      return cell;
    }
    if (Array.isArray(value.richText)) {
      return { type: 'string', value: value.richText.map((part) => part.text || '').join('') };
    }
    if (typeof value.text === 'string') return { type: 'string', value: value.text };
    if (value.error !== undefined) return { type: 'string', value: String(value.error) };
  }
  return { type: 'string', value: String(value) };
};

const encodeStyle = (cell) => {
  const style = {};
  const font = cell.font;
  if (font) {
    if (font.bold) style.bold = true;
    const color = argbOf(font.color);
    if (color) style.color = color;
  }
  const fill = cell.fill;
  if (fill && fill.type === 'pattern' && fill.pattern === 'solid') {
    const color = argbOf(fill.fgColor);
    if (color) style.fill = color;
  }
  return Object.keys(style).length ? style : undefined;
};

class Cell {
  constructor(row, col) {
    this._row = row;
    this._col = col;
    this._value = null;
    this.font = row.font ? Object.assign({}, row.font) : undefined;
    this.fill = row.fill ? Object.assign({}, row.fill) : undefined;
    this.numFmt = undefined;
    this.alignment = undefined;
    this.border = undefined;
  }

  get row() { return this._row.number; }
  get col() { return this._col; }
  get address() { return columnLetters(this._col) + this._row.number; }
  get worksheet() { return this._row.worksheet; }

  get value() { return this._value; }
  set value(v) { this._value = v === undefined ? null : v; }

  get formula() {
    const v = this._value;
    return v && typeof v === 'object' && 'formula' in v ? v.formula : undefined;
  }

  get result() {
    const v = this._value;
    return v && typeof v === 'object' && 'formula' in v ? v.result : undefined;
  }

  get text() {
    const v = this._value;
    if (v === null) return '';
    if (v instanceof Date) return v.toISOString();
    if (typeof v === 'object') {
      if ('formula' in v) return v.result === undefined ? '' : String(v.result);
      if (Array.isArray(v.richText)) return v.richText.map((p) => p.text || '').join('');
      if (typeof v.text === 'string') return v.text;
    }
    return String(v);
  }

  toString() { return this.text; }
}

class Row {
  constructor(worksheet, number) {
    this._worksheet = worksheet;
    this.number = number;
    this._cells = [];
    this._font = undefined;
    this._fill = undefined;
    this.height = undefined;
  }

  get worksheet() { return this._worksheet; }

  get font() { return this._font; }
  set font(font) {
    this._font = font;
    this._cells.forEach((cell) => { if (cell) cell.font = font ? Object.assign({}, font) : undefined; });
  }

  get fill() { return this._fill; }
  set fill(fill) {
    this._fill = fill;
    this._cells.forEach((cell) => { if (cell) cell.fill = fill ? Object.assign({}, fill) : undefined; });
  }

  _columnNumber(indexOrKey) {
    if (typeof indexOrKey === 'number') return indexOrKey;
    const column = this._worksheet._columnByKey(indexOrKey);
    if (column) return column.number;
    if (/^[A-Za-z]{1,3}$/.test(String(indexOrKey))) return lettersToNumber(String(indexOrKey));
    throw new Error(`Unknown column: ${indexOrKey}`);
  }

  getCell(indexOrKey) {
    const col = this._columnNumber(indexOrKey);
    if (!Number.isInteger(col) || col < 1) throw new Error(`Invalid column: ${indexOrKey}`);
    if (!this._cells[col]) this._cells[col] = new Cell(this, col);
    return this._cells[col];
  }

  findCell(col) { return this._cells[col]; }

  get values() {
    const values = [];
    this._cells.forEach((cell, col) => {
      if (cell && cell.value !== null) values[col] = cell.value;
    });
    return values;
  }

  set values(values) {
    this._cells.forEach((cell) => { if (cell) cell.value = null; });
    if (Array.isArray(values)) {
      // Index 0 present: contiguous array starting at column 1
      const offset = Object.prototype.hasOwnProperty.call(values, '0') ? 1 : 0;
      values.forEach((value, index) => {
        if (value !== undefined) this.getCell(index + offset).value = value;
      });
    } else if (values && typeof values === 'object') {
      for (const [key, value] of Object.entries(values)) {
        const column = this._worksheet._columnByKey(key);
        if (column && value !== undefined) this.getCell(column.number).value = value;
      }
    }
  }

  get hasValues() { return this._cells.some((cell) => cell && cell.value !== null); }
  get cellCount() { return this._cells.length ? this._cells.length - 1 : 0; }
  get actualCellCount() { return this._cells.filter((cell) => cell && cell.value !== null).length; }

  eachCell(options, callback) {
    if (typeof options === 'function') {
      callback = options;
      options = {};
    }
    const includeEmpty = options && options.includeEmpty;
    const last = this._cells.length;
    for (let col = 1; col < last; col++) {
      const cell = includeEmpty ? this.getCell(col) : this._cells[col];
      if (cell && (includeEmpty || cell.value !== null)) callback(cell, col);
    }
  }

  commit() {}
}

class Column {
  constructor(worksheet, number, definition = {}) {
    this._worksheet = worksheet;
    this.number = number;
    this.header = definition.header;
    this.key = definition.key;
    this.width = definition.width;
  }

  get letter() { return columnLetters(this.number); }
}

class Worksheet {
  constructor(workbook, id, name) {
    this._workbook = workbook;
    this.id = id;
    this.name = name;
    this.state = 'visible';
    this._rows = [];
    this._columns = [];
  }

  get workbook() { return this._workbook; }

  _columnByKey(key) {
    return this._columns.find((column) => column && column.key !== undefined && column.key === key);
  }

  get columns() { return this._columns.filter(Boolean); }
  set columns(definitions) {
    this._columns = [];
    (definitions || []).forEach((definition, index) => {
      this._columns[index + 1] = new Column(this, index + 1, definition || {});
    });
    if (this._columns.some((column) => column && column.header !== undefined)) {
      const headerRow = this.getRow(1);
      this._columns.forEach((column) => {
        if (column && column.header !== undefined) headerRow.getCell(column.number).value = column.header;
      });
    }
  }

  getColumn(indexOrKey) {
    let number;
    if (typeof indexOrKey === 'number') {
      number = indexOrKey;
    } else {
      const byKey = this._columnByKey(indexOrKey);
      if (byKey) return byKey;
      number = lettersToNumber(String(indexOrKey));
    }
    if (!Number.isInteger(number) || number < 1) throw new Error(`Invalid column: ${indexOrKey}`);
    if (!this._columns[number]) this._columns[number] = new Column(this, number);
    return this._columns[number];
  }

  get rowCount() { return this._rows.length ? this._rows.length - 1 : 0; }
  get actualRowCount() { return this._rows.filter((row) => row && row.hasValues).length; }

  get columnCount() {
    let count = this._columns.length ? this._columns.length - 1 : 0;
    this._rows.forEach((row) => { if (row) count = Math.max(count, row.cellCount); });
    return count;
  }

  get lastRow() { return this.rowCount ? this.getRow(this.rowCount) : undefined; }

  getRow(number) {
    if (!Number.isInteger(number) || number < 1) throw new Error(`Invalid row number: ${number}`);
    if (!this._rows[number]) this._rows[number] = new Row(this, number);
    return this._rows[number];
  }

  findRow(number) { return this._rows[number]; }

  getRows(start, length) {
    const rows = [];
    for (let i = 0; i < length; i++) rows.push(this.getRow(start + i));
    return rows;
  }

  addRow(values) {
    const row = this.getRow(this.rowCount + 1);
    row.values = values;
    return row;
  }

  addRows(list) { return (list || []).map((values) => this.addRow(values)); }

  getCell(refOrRow, col) {
    if (col !== undefined) return this.getRow(refOrRow).getCell(col);
    const { row, col: column } = parseAddress(refOrRow);
    return this.getRow(row).getCell(column);
  }

  eachRow(options, callback) {
    if (typeof options === 'function') {
      callback = options;
      options = {};
    }
    const includeEmpty = options && options.includeEmpty;
    for (let number = 1; number < this._rows.length; number++) {
      const row = includeEmpty ? this.getRow(number) : this._rows[number];
      if (row && (includeEmpty || row.hasValues)) callback(row, number);
    }
  }

  _toModel() {
    const columns = [];
    this._columns.forEach((column) => {
      if (column && typeof column.width === 'number' && column.width > 0) {
        columns.push({ index: column.number, width: column.width });
      }
    });
    const rows = [];
    this._rows.forEach((row) => {
      if (!row) return;
      const cells = [];
      row._cells.forEach((cell) => {
        if (!cell) return;
        const encoded = encodeValue(cell.value);
        const style = encodeStyle(cell);
        if (!encoded && !style) return;
        const out = Object.assign({ col: cell.col }, encoded || { type: 'empty' });
        if (style) out.style = style;
        cells.push(out);
      });
      if (cells.length) rows.push({ number: row.number, cells });
    });
    return { name: this.name, columns, rows };
  }

  _fromModel(model) {
    (model.columns || []).forEach((column) => {
      this.getColumn(column.index).width = column.width;
    });
    (model.rows || []).forEach((rowModel) => {
      const row = this.getRow(rowModel.number);
      (rowModel.cells || []).forEach((cellModel) => {
        const cell = row.getCell(cellModel.col);
        if (cellModel.type === 'formula') {
          cell.value = cellModel.result === undefined
            ? { formula: cellModel.formula }
            : { formula: cellModel.formula, result: cellModel.result };
        } else if (cellModel.type !== 'empty') {
          cell.value = cellModel.value;
        }
        const style = cellModel.style;
        if (style) {
          if (style.bold || style.color) {
            cell.font = {};
            if (style.bold) cell.font.bold = true;
            if (style.color) cell.font.color = { argb: style.color };
          }
          if (style.fill) {
            cell.fill = { type: 'pattern', pattern: 'solid', fgColor: { argb: style.fill } };
          }
        }
      });
    });
  }
}

class Workbook {
  constructor() {
    this.creator = '';
    this.lastModifiedBy = '';
    this.created = new Date();
    this.modified = new Date();
    this._worksheets = [];
    const workbook = this;
    this.xlsx = {
      async writeBuffer() {
        return encode(workbook._toModel());
      },
      async load(data) {
        workbook._fromModel(decode(data));
        return workbook;
      },
      async writeFile() {
        throw new Error('xlsx.writeFile is not available in the sandbox; use ctx.files.write(name, await workbook.xlsx.writeBuffer())');
      },
      async readFile() {
        throw new Error('xlsx.readFile is not available in the sandbox; use workbook.xlsx.load(await ctx.files.read(name))');
      },
    };
  }

  get worksheets() { return this._worksheets.filter(Boolean); }

  addWorksheet(name, options) {
    const id = this._worksheets.length ? this._worksheets.length : 1;
    let sheetName = name === undefined ? `Sheet${id}` : String(name);
    if (sheetName.length > 31) sheetName = sheetName.slice(0, 31);
    if (this.worksheets.some((sheet) => sheet.name.toLowerCase() === sheetName.toLowerCase())) {
      throw new Error(`Worksheet name already exists: ${sheetName}`);
    }
    const sheet = new Worksheet(this, id, sheetName);
    if (options && options.state) sheet.state = options.state;
    this._worksheets[id] = sheet;
    return sheet;
  }

  getWorksheet(idOrName) {
    if (idOrName === undefined) return this.worksheets[0];
    if (typeof idOrName === 'number') return this._worksheets[idOrName];
    return this.worksheets.find((sheet) => sheet.name === idOrName);
  }

  removeWorksheet(idOrName) {
    const sheet = this.getWorksheet(idOrName);
    if (sheet) delete this._worksheets[sheet.id];
  }

  eachSheet(callback) {
    this.worksheets.forEach((sheet) => callback(sheet, sheet.id));
  }

  _toModel() {
    return {
      creator: String(this.creator || ''),
      sheets: this.worksheets.map((sheet) => sheet._toModel()),
    };
  }

  _fromModel(model) {
    this._worksheets = [];
    if (model.creator) this.creator = model.creator;
    (model.sheets || []).forEach((sheetModel) => {
      this.addWorksheet(sheetModel.name)._fromModel(sheetModel);
    });
  }
}

const ValueType = Object.freeze({
  Null: 0, Merge: 1, Number: 2, String: 3, Date: 4, Hyperlink: 5,
  Formula: 6, SharedString: 7, RichText: 8, Boolean: 9, Error: 10,
});

export { Workbook, Worksheet, Row, Cell, Column, ValueType };
export default { Workbook, ValueType };
)JS";

}  // namespace

const char* ContextPreludeSource() {
  return kContextPrelude;
}

const char* ExcelJsModuleSource() {
  return kExcelJsModule;
}

}  // namespace scriptbox
